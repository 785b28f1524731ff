/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file id_generator.cpp
 * @brief Implementation of the random identifier utility.
 */

#include "aula/infra/id_generator.hpp"

#include <array>
#include <cstdint>
#include <random>

namespace aula::infra {

namespace {

constexpr char kHexDigits[] = "0123456789abcdef";

std::mt19937_64& engine()
{
    static thread_local std::random_device rd;
    static thread_local std::mt19937_64 gen(rd());
    return gen;
}

} // namespace

/**
 * @brief Builds a v4 UUID from 16 random bytes.
 *
 * Byte 6 carries the version nibble (`0100`), byte 8 the RFC 4122 variant (`10`).
 */
std::string IdGenerator::generate()
{
    std::array<std::uint8_t, 16> bytes{};
    std::uniform_int_distribution<std::uint32_t> dis(0, 255);
    for (auto& b : bytes) {
        b = static_cast<std::uint8_t>(dis(engine()));
    }

    bytes[6] = static_cast<std::uint8_t>((bytes[6] & 0x0F) | 0x40);
    bytes[8] = static_cast<std::uint8_t>((bytes[8] & 0x3F) | 0x80);

    std::string out;
    out.reserve(36);
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            out.push_back('-');
        }
        out.push_back(kHexDigits[bytes[i] >> 4]);
        out.push_back(kHexDigits[bytes[i] & 0x0F]);
    }
    return out;
}

std::string IdGenerator::random_hex(std::size_t length)
{
    std::uniform_int_distribution<int> dis(0, 15);
    std::string out(length, '0');
    for (auto& c : out) {
        c = kHexDigits[dis(engine())];
    }
    return out;
}

} // namespace aula::infra
