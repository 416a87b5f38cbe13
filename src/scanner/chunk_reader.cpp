#include "record_stager/chunk_reader.hpp"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <string_view>
#include <vector>

namespace rs {

struct ChunkReader::Impl {
  std::string path;
  Config cfg;
  int last_errno{0};
  bool stopped{false};
  std::uint64_t bytes{0};
  std::uint64_t lines{0};
  std::uint64_t oversize{0};

  bool emit(std::string_view out, const LineCallback& cb) {
    if (cfg.strip_cr && !out.empty() && out.back() == '\r') out.remove_suffix(1);
    ++lines;
    if (!cb(out)) { stopped = true; return false; }
    return true;
  }

  bool for_each_line(const LineCallback& cb) {
    FILE* f = std::fopen(path.c_str(), "rb");
    if (!f) { last_errno = errno; return false; }

    std::vector<char> buf(cfg.chunk_bytes, 0);
    std::string carry;
    carry.reserve(256);
    bool skipping_oversize = false; // drop until next newline

    while (true) {
      std::size_t n = std::fread(buf.data(), 1, cfg.chunk_bytes, f);
      if (n == 0 && std::ferror(f)) { last_errno = errno; std::fclose(f); return false; }
      if (n == 0) break;
      bytes += n;

      std::string_view block(buf.data(), n);
      std::size_t start = 0;
      while (start <= block.size()) {
        const std::size_t pos = block.find('\n', start);
        if (pos == std::string_view::npos) {
          std::string_view rest = block.substr(start);
          if (skipping_oversize) break;
          if (carry.size() + rest.size() > cfg.max_record_bytes) {
            ++oversize;
            skipping_oversize = true;
            if (!cfg.drop_oversize) {
              carry.append(rest.substr(0, cfg.max_record_bytes - carry.size()));
              if (!emit(carry, cb)) { std::fclose(f); return false; }
            }
            carry.clear();
          } else {
            carry.append(rest);
          }
          break;
        }

        std::string_view slice = block.substr(start, pos - start);
        start = pos + 1;
        if (skipping_oversize) { skipping_oversize = false; continue; }
        if (carry.size() + slice.size() > cfg.max_record_bytes) {
          ++oversize;
          if (!cfg.drop_oversize) {
            carry.append(slice.substr(0, cfg.max_record_bytes - carry.size()));
            if (!emit(carry, cb)) { std::fclose(f); return false; }
          }
          carry.clear();
          continue;
        }

        bool keep_going;
        if (!carry.empty()) {
          carry.append(slice);
          keep_going = emit(carry, cb);
          carry.clear();
        } else {
          keep_going = emit(slice, cb);
        }
        if (!keep_going) { std::fclose(f); return false; }
      }
    }

    if (!carry.empty() && !skipping_oversize) {
      if (!emit(carry, cb)) { std::fclose(f); return false; }
    }

    std::fclose(f);
    return true;
  }
};

ChunkReader::ChunkReader(std::string path)
  : ChunkReader(std::move(path), Config{}) {}

ChunkReader::ChunkReader(std::string path, Config cfg)
  : p_(new Impl{std::move(path), cfg}) {}

ChunkReader::~ChunkReader() { delete p_; }

bool ChunkReader::for_each_line(const LineCallback& cb) { return p_->for_each_line(cb); }
int  ChunkReader::last_error() const noexcept { return p_->last_errno; }
bool ChunkReader::stopped() const noexcept { return p_->stopped; }
std::uint64_t ChunkReader::bytes_read() const noexcept { return p_->bytes; }
std::uint64_t ChunkReader::lines_read() const noexcept { return p_->lines; }
std::uint64_t ChunkReader::oversize_lines() const noexcept { return p_->oversize; }

std::string ChunkReader::error_message() const {
  if (p_->last_errno == 0) return {};
  return p_->path + ": " + std::strerror(p_->last_errno);
}

}
