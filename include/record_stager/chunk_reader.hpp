#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace rs {

// Reads a file in fixed-size chunks and hands out physical lines
// (terminator removed). Lines crossing a chunk boundary are stitched in a
// carry buffer.
class ChunkReader {
public:
  struct Config {
    std::size_t chunk_bytes      = 512 * 1024;      // 512 KiB
    std::size_t max_record_bytes = 8 * 1024 * 1024; // 8 MiB guard per line
    bool        strip_cr         = true;            // trim trailing '\r' (CRLF)
    bool        drop_oversize    = true;            // drop lines exceeding guard, else truncate
  };

  // Return false to stop reading.
  using LineCallback = std::function<bool(std::string_view)>;

  explicit ChunkReader(std::string path);
  ChunkReader(std::string path, Config cfg);
  ~ChunkReader();
  ChunkReader(const ChunkReader&) = delete;
  ChunkReader& operator=(const ChunkReader&) = delete;

  // False on I/O error or when the callback stopped early (see stopped()).
  bool for_each_line(const LineCallback& cb);

  int  last_error() const noexcept;                 // errno of the failing call, 0 if none
  std::string error_message() const;
  bool stopped() const noexcept;
  std::uint64_t bytes_read() const noexcept;
  std::uint64_t lines_read() const noexcept;
  std::uint64_t oversize_lines() const noexcept;

private:
  struct Impl; Impl* p_;
};

}
