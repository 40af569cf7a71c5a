/* This file is part of Canonica project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * the LICENSE file in the root of the source tree */
#ifndef CANONICA_BCS_HPP
#define CANONICA_BCS_HPP

#include <canonica/bcs/config.hpp>
#include <canonica/bcs/decoder.hpp>
#include <canonica/bcs/deserializer.hpp>
#include <canonica/bcs/error.hpp>
#include <canonica/bcs/source.hpp>
#include <canonica/bcs/stream.hpp>
#include <canonica/logger.hpp>

/*
 * Each function performs exactly one top-level decode and fails with remaining_input
 * unless the whole input has been consumed. Values decoded from a buffer may
 * borrow from it, so the buffer must outlive them. Values decoded from a read_stream are owned.
 */
namespace canonica::bcs {
    inline void check_depth_limit(const size_t limit)
    {
        if (limit > max_container_depth) [[unlikely]]
            throw not_supported_error { fmt::format("limit exceeds the max allowed depth: {} > {}", limit, max_container_depth) };
    }

    template<byte_source S, typename SEED>
    auto decode_all(S &src, SEED &&seed, const size_t limit)
    {
        logger::trace("bcs decode started with max container depth {}", limit);
        try {
            decoder dec { src, limit };
            auto res = seed(dec);
            dec.end();
            logger::trace("bcs decode finished after {} bytes", src.position());
            return res;
        } catch (const decode_error &ex) {
            logger::debug("bcs decode failed at offset {}: {}", src.position(), ex.what());
            throw;
        }
    }

    template<typename SEED>
    auto from_bytes_seed_with_limit(SEED &&seed, const buffer bytes, const size_t limit)
    {
        check_depth_limit(limit);
        slice_source src { bytes };
        return decode_all(src, std::forward<SEED>(seed), limit);
    }

    template<typename SEED>
    auto from_bytes_seed(SEED &&seed, const buffer bytes)
    {
        return from_bytes_seed_with_limit(std::forward<SEED>(seed), bytes, max_container_depth);
    }

    template<typename T>
    T from_bytes_with_limit(const buffer bytes, const size_t limit)
    {
        return from_bytes_seed_with_limit([](auto &dec) { return dec.template decode<T>(); }, bytes, limit);
    }

    template<typename T>
    T from_bytes(const buffer bytes)
    {
        return from_bytes_with_limit<T>(bytes, max_container_depth);
    }

    template<typename SEED>
    auto from_reader_seed_with_limit(SEED &&seed, read_stream &stream, const size_t limit)
    {
        check_depth_limit(limit);
        reader_source src { stream };
        return decode_all(src, std::forward<SEED>(seed), limit);
    }

    template<typename SEED>
    auto from_reader_seed(SEED &&seed, read_stream &stream)
    {
        return from_reader_seed_with_limit(std::forward<SEED>(seed), stream, max_container_depth);
    }

    template<typename T>
    T from_reader_with_limit(read_stream &stream, const size_t limit)
    {
        return from_reader_seed_with_limit([](auto &dec) { return dec.template decode<T>(); }, stream, limit);
    }

    template<typename T>
    T from_reader(read_stream &stream)
    {
        return from_reader_with_limit<T>(stream, max_container_depth);
    }
}

#endif // !CANONICA_BCS_HPP
