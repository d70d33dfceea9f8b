/*
 * Triage Framework
 *
 * Copyright (c) 2026 Triage Framework developers. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

#define CATCH_CONFIG_MAIN
#define CATCH_CONFIG_CONSOLE_WIDTH 120

#include "catch2/catch.hpp"
#include "test/runner.h"
#include <iostream>
#include <fstream>
#include <memory>
#include <algorithm>
#include <random>
#include <sstream>
#include <stdexcept>

/* This program runs the catch2 tests */

/* Support for runners */
namespace runner {
    std::filesystem::path NamedTemporaryDirectory(std::string prefix, unsigned long long max_tries) {
        std::random_device dev;
        std::mt19937 prng(dev());
        std::uniform_int_distribution<uint64_t> rand(0);
        std::filesystem::path path;
        for (unsigned int i=0; i<max_tries; i++ ){
            std::stringstream ss;
            ss << prefix << "_" << std::hex << rand(prng);
            path = std::filesystem::temp_directory_path() / ss.str();
            if (std::filesystem::create_directory(path)) {
                return path;
            }
        }
        throw std::runtime_error("could not create NamedTemporaryDirectory");
    }

    bool contains(std::string line, std::string substr) {
        return line.find(substr) != std::string::npos;
    }

    std::string file_contents(std::filesystem::path path) {
        std::ifstream in(path, std::ios::binary | std::ios::ate);
        REQUIRE (in.is_open());
        auto size = in.tellg();
        std::unique_ptr<char[]>memblock(new char [size]);
        in.seekg (0, std::ios::beg);
        in.read (memblock.get(), size);
        in.close();
        return std::string(memblock.get(),size);
    }

    void write_file(std::filesystem::path path, const std::vector<uint8_t> &data) {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        REQUIRE (out.is_open());
        if (!data.empty())
            out.write(reinterpret_cast<const char *>(&data[0]), data.size());
        out.close();
        REQUIRE (out.good());
    }

    temp_dir::temp_dir(std::string testname) {
        path = NamedTemporaryDirectory("tri_" + testname);
    }

    temp_dir::~temp_dir() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
        if (ec)
            std::cerr << "could not remove " << path << ": " << ec.message() << "\n";
    }

    void put_u16(std::vector<uint8_t> &buf, size_t offset, uint16_t value) {
        if (buf.size() < offset + 2)
            buf.resize(offset + 2);
        buf[offset] = value & 0xFF;
        buf[offset + 1] = (value >> 8) & 0xFF;
    }

    void put_u32(std::vector<uint8_t> &buf, size_t offset, uint32_t value) {
        put_u16(buf, offset, value & 0xFFFF);
        put_u16(buf, offset + 2, (value >> 16) & 0xFFFF);
    }

    void put_u64(std::vector<uint8_t> &buf, size_t offset, uint64_t value) {
        put_u32(buf, offset, (uint32_t)(value & 0xFFFFFFFF));
        put_u32(buf, offset + 4, (uint32_t)(value >> 32));
    }

    void put_bytes(std::vector<uint8_t> &buf, size_t offset, const std::vector<uint8_t> &bytes) {
        if (buf.size() < offset + bytes.size())
            buf.resize(offset + bytes.size());
        std::copy(bytes.begin(), bytes.end(), buf.begin() + offset);
    }

    void put_ascii(std::vector<uint8_t> &buf, size_t offset, const std::string &str) {
        put_bytes(buf, offset, std::vector<uint8_t>(str.begin(), str.end()));
    }

    std::vector<uint8_t> utf16(const std::string &str) {
        std::vector<uint8_t> out;
        for (size_t i = 0; i < str.size(); i++) {
            out.push_back((uint8_t)str[i]);
            out.push_back(0);
        }
        return out;
    }

    uint64_t to_filetime(int64_t unixTime) {
        return ((uint64_t)unixTime + 11644473600ULL) * 10000000ULL;
    }
}
