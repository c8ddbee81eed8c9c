#include "utils/ring_buffer.hpp"
#include <atomic>
#include <memory>
#include <thread>
#include <vector>
#include <catch2/catch.hpp>
//---------------------------------------------------------------------------
// BlobCopy - Chunked Cloud Blob Transfer Engine
// Dominik Durner, 2025
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace blobcopy::utils::test {
//---------------------------------------------------------------------------
TEST_CASE("ring_buffer") {
    RingBuffer<uint64_t> rb(2);
    REQUIRE(rb.capacity() == 2);
    REQUIRE(rb.insert(1) == 0);
    REQUIRE(rb.insert(2) == 1);
    REQUIRE(rb.full());
    REQUIRE(rb.insert(2) == ~0ull);
    REQUIRE(rb.size() == 2);
    REQUIRE(rb.consume().value() == 1);
    REQUIRE(rb.insert(3) == 2);
    REQUIRE(rb.consume().value() == 2);
    REQUIRE(rb.consume().value() == 3);
    REQUIRE(!rb.consume().has_value());
    REQUIRE(rb.empty());
}
//---------------------------------------------------------------------------
TEST_CASE("ring_buffer_move_only") {
    RingBuffer<std::unique_ptr<int>> rb(4);
    REQUIRE(rb.insert(std::make_unique<int>(7)) == 0);
    auto value = rb.consume();
    REQUIRE(value.has_value());
    REQUIRE(**value == 7);
    REQUIRE(rb.empty());
}
//---------------------------------------------------------------------------
TEST_CASE("single_threaded_insert_multi_threaded_consume") {
    RingBuffer<uint64_t> rb(1000);
    for (auto i = 0u; i < 1000u; i++) {
        REQUIRE(rb.insert<true>(i) != ~0ull);
    }
    std::atomic<uint64_t> sum = 0;
    std::vector<std::thread> threads;
    for (auto i = 0u; i < 10u; i++) {
        threads.push_back(std::thread([&] {
            for (int j = 0; j < 100; j++)
                sum += rb.consume<true>().value();
        }));
    }
    for (auto& th : threads) {
        th.join();
    }
    REQUIRE(sum == 999ull * 1000 / 2);
    REQUIRE(!rb.consume().has_value());
}
//---------------------------------------------------------------------------
TEST_CASE("multi_threaded_ring_buffer_multi_threaded_consume") {
    RingBuffer<uint64_t> rb(1000);
    std::vector<std::thread> threads;
    for (int i = 0; i < 10; i++) {
        threads.push_back(std::thread([&] {
            for (auto j = 0u; j < 100u; j++)
                rb.insert<true>(j);
        }));
    }
    for (auto& th : threads) {
        th.join();
    }
    REQUIRE(rb.size() == 1000);

    // Consume multi-threaded
    std::atomic<uint64_t> sum = 0;
    threads.clear();
    for (int i = 0; i < 10; i++) {
        threads.push_back(std::thread([&] {
            for (auto j = 0u; j < 100u; j++)
                sum += rb.consume<true>().value();
        }));
    }
    for (auto& th : threads) {
        th.join();
    }
    REQUIRE(sum == 10ull * 99 * 100 / 2);
    REQUIRE(!rb.consume().has_value());
}
//---------------------------------------------------------------------------
} // namespace blobcopy::utils::test
