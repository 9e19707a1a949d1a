// src/gzip_codec.cpp
#include "gzip_codec.hpp"

#include <climits>
#include <zlib.h> // Requires linking with ZLIB::ZLIB

namespace FileSplitter
{
    namespace Compression
    {

        namespace
        {
            // 15 bits of window plus 16 selects the gzip wrapper instead of zlib's
            const int GZIP_WINDOW_BITS = 15 + 16;
            const int MEMORY_LEVEL = 8;

            // zlib counts input in uInt; larger windows are fed in slices
            const size_t MAX_INPUT_SLICE = UINT_MAX;

            std::string zlibMessage(const char *operation, int rc, const z_stream &stream)
            {
                std::string text = std::string(operation) + " failed with zlib error " + std::to_string(rc);
                if (stream.msg != nullptr)
                {
                    text += " (";
                    text += stream.msg;
                    text += ")";
                }
                return text;
            }

            void feedInput(z_stream &stream, const std::vector<char> &input, size_t &offset)
            {
                size_t remaining = input.size() - offset;
                size_t take = remaining > MAX_INPUT_SLICE ? MAX_INPUT_SLICE : remaining;
                stream.next_in = reinterpret_cast<Bytef *>(const_cast<char *>(input.data() + offset));
                stream.avail_in = static_cast<uInt>(take);
                offset += take;
            }
        } // namespace

        std::vector<char> GzipCodec::compress(const std::vector<char> &input, int level)
        {
            if (level < Z_DEFAULT_COMPRESSION || level > Z_BEST_COMPRESSION)
            {
                throw GzipError("Invalid compression level " + std::to_string(level));
            }

            z_stream stream{};
            int rc = deflateInit2(&stream, level, Z_DEFLATED, GZIP_WINDOW_BITS, MEMORY_LEVEL, Z_DEFAULT_STRATEGY);
            if (rc != Z_OK)
            {
                throw GzipError(zlibMessage("deflateInit2", rc, stream));
            }

            std::vector<char> output;
            output.reserve(static_cast<size_t>(deflateBound(&stream, static_cast<uLong>(input.size()))));
            std::vector<unsigned char> buffer(BUFFER_SIZE);

            size_t offset = 0;
            int flush = Z_NO_FLUSH;
            do
            {
                feedInput(stream, input, offset);
                flush = offset == input.size() ? Z_FINISH : Z_NO_FLUSH;

                do
                {
                    stream.next_out = buffer.data();
                    stream.avail_out = static_cast<uInt>(buffer.size());
                    rc = deflate(&stream, flush);
                    if (rc == Z_STREAM_ERROR)
                    {
                        std::string message = zlibMessage("deflate", rc, stream);
                        deflateEnd(&stream);
                        throw GzipError(message);
                    }
                    size_t produced = buffer.size() - stream.avail_out;
                    output.insert(output.end(), buffer.data(), buffer.data() + produced);
                } while (stream.avail_out == 0);
            } while (flush != Z_FINISH);

            deflateEnd(&stream);
            if (rc != Z_STREAM_END)
            {
                throw GzipError("deflate did not reach the end of the stream");
            }
            return output;
        }

        std::vector<char> GzipCodec::decompress(const std::vector<char> &input, size_t max_output)
        {
            z_stream stream{};
            int rc = inflateInit2(&stream, GZIP_WINDOW_BITS);
            if (rc != Z_OK)
            {
                throw GzipError(zlibMessage("inflateInit2", rc, stream));
            }

            std::vector<char> output;
            std::vector<unsigned char> buffer(BUFFER_SIZE);
            size_t offset = 0;

            do
            {
                if (stream.avail_in == 0 && offset < input.size())
                {
                    feedInput(stream, input, offset);
                }

                stream.next_out = buffer.data();
                stream.avail_out = static_cast<uInt>(buffer.size());
                rc = inflate(&stream, Z_NO_FLUSH);

                switch (rc)
                {
                case Z_NEED_DICT:
                case Z_DATA_ERROR:
                case Z_MEM_ERROR:
                case Z_STREAM_ERROR:
                {
                    std::string message = zlibMessage("inflate", rc, stream);
                    inflateEnd(&stream);
                    throw GzipError(message);
                }
                case Z_BUF_ERROR:
                    // No progress possible: every input byte is consumed but the member isn't finished
                    if (stream.avail_in == 0 && offset == input.size())
                    {
                        inflateEnd(&stream);
                        throw GzipError("Truncated gzip stream");
                    }
                    break;
                default:
                    break;
                }

                size_t produced = buffer.size() - stream.avail_out;
                if (output.size() + produced > max_output)
                {
                    inflateEnd(&stream);
                    throw GzipError("Decompressed data exceeds the expected " + std::to_string(max_output) + " bytes");
                }
                output.insert(output.end(), buffer.data(), buffer.data() + produced);
            } while (rc != Z_STREAM_END);

            bool trailing = stream.avail_in != 0 || offset < input.size();
            inflateEnd(&stream);
            if (trailing)
            {
                throw GzipError("Unexpected data after the end of the gzip stream");
            }
            return output;
        }

    } // namespace Compression
} // namespace FileSplitter
