// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license
// Test runner entry point

#include <catch2/catch_session.hpp>
#include <string>

void InitializeTestLogging(const std::string& level);
void ShutdownTestLogging();

int main(int argc, char* argv[]) {
    // Decoders log rejections at debug level; keep test output quiet
    InitializeTestLogging("warn");

    int result = Catch::Session().run(argc, argv);

    ShutdownTestLogging();
    return result;
}
