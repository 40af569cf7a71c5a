/* This file is part of Canonica project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * the LICENSE file in the root of the source tree */

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <ios>
#include <unistd.h>
#include <canonica/bcs/stream.hpp>
#include <canonica/logger.hpp>

namespace canonica::bcs {
    size_t istream_reader::_read_impl(const write_buffer out)
    {
        if (out.empty())
            return 0;
        if (_is.bad() || (_is.fail() && !_is.eof())) [[unlikely]]
            throw io_error("the input stream is in a failed state");
        if (_is.eof())
            return 0;
        try {
            _is.read(reinterpret_cast<char *>(out.data()), static_cast<std::streamsize>(out.size()));
        } catch (const std::ios_base::failure &ex) {
            // a stream with exceptions enabled also throws on a short read at the end of input
            if (_is.bad() || !_is.eof())
                throw io_error(fmt::format("the input stream has failed: {}", ex.what()));
        }
        if (_is.bad()) [[unlikely]]
            throw io_error("the input stream has failed");
        return static_cast<size_t>(_is.gcount());
    }

    file_reader::file_reader(const std::string &path):
        _path { path }, _fd { ::open(path.c_str(), O_RDONLY) }
    {
        if (_fd < 0) [[unlikely]]
            throw error_sys(fmt::format("failed to open {} for reading", _path));
        logger::trace("opened {} for decoding", _path);
    }

    file_reader::~file_reader()
    {
        if (_fd >= 0 && ::close(_fd) != 0)
            logger::warn("failed to close {}: {}", _path, std::strerror(errno));
    }

    size_t file_reader::_read_impl(const write_buffer out)
    {
        for (;;) {
            const auto res = ::read(_fd, out.data(), out.size());
            if (res >= 0) [[likely]]
                return static_cast<size_t>(res);
            if (errno != EINTR) [[unlikely]]
                throw io_error(fmt::format("failed to read from {}: {}", _path, std::strerror(errno)));
        }
    }

    size_t buffer_reader::_read_impl(const write_buffer out)
    {
        const auto num_bytes = std::min({ out.size(), _max_chunk, _data.size() - _pos });
        if (num_bytes) {
            memcpy(out.data(), _data.data() + _pos, num_bytes);
            _pos += num_bytes;
        }
        return num_bytes;
    }
}
