/* This file is part of Canonica project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * the LICENSE file in the root of the source tree */
#ifndef CANONICA_BCS_STREAM_HPP
#define CANONICA_BCS_STREAM_HPP

#include <istream>
#include <limits>
#include <string>
#include <canonica/common/bytes.hpp>
#include <canonica/bcs/error.hpp>

namespace canonica::bcs {
    /*
     * An incremental byte reader. read may return fewer bytes than requested,
     * returns zero only at the end of input, and throws io_error on any other failure.
     */
    struct read_stream {
        virtual ~read_stream() =default;

        size_t read(const write_buffer out)
        {
            return _read_impl(out);
        }
    private:
        virtual size_t _read_impl(write_buffer out) =0;
    };

    struct istream_reader: read_stream {
        explicit istream_reader(std::istream &is): _is { is }
        {
        }
    private:
        std::istream &_is;

        size_t _read_impl(write_buffer out) override;
    };

    struct file_reader: read_stream {
        file_reader(const file_reader &) =delete;
        explicit file_reader(const std::string &path);
        ~file_reader() override;
    private:
        std::string _path;
        int _fd = -1;

        size_t _read_impl(write_buffer out) override;
    };

    // Serves an in-memory buffer in chunks of at most max_chunk bytes.
    // The buffer is not copied and must outlive the reader.
    struct buffer_reader: read_stream {
        buffer_reader(uint8_vector &&, size_t max_chunk=std::numeric_limits<size_t>::max()) =delete;

        explicit buffer_reader(const buffer data, const size_t max_chunk=std::numeric_limits<size_t>::max()):
            _data { data }, _max_chunk { max_chunk }
        {
            if (!_max_chunk) [[unlikely]]
                throw error("buffer_reader's chunk size must be greater than zero!");
        }

        size_t position() const noexcept
        {
            return _pos;
        }
    private:
        buffer _data;
        size_t _max_chunk;
        size_t _pos = 0;

        size_t _read_impl(write_buffer out) override;
    };
}

#endif // !CANONICA_BCS_STREAM_HPP
