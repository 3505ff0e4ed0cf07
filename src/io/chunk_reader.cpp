#include "khiops_report/chunk_reader.hpp"
#include "khiops_report/byte_source.hpp"

#include <algorithm>
#include <vector>

namespace kr {

struct ChunkReader::Impl {
  ByteCursor& cursor;
  Config cfg;
  std::vector<char> buf;
  std::uint64_t bytes{0};
  std::uint64_t chunks{0};
  bool eof{false};

  Impl(ByteCursor& c, Config k) : cursor(c), cfg(k), buf(std::max<std::size_t>(k.chunk_bytes, 1)) {}

  bool read_next(Chunk& out) {
    if (eof || bytes >= cfg.limit) return false;
    std::uint64_t left = cfg.limit - bytes;
    std::size_t want = static_cast<std::size_t>(std::min<std::uint64_t>(buf.size(), left));

    const std::uint64_t at = cursor.tell();
    std::size_t n = cursor.read(buf.data(), want);
    if (n == 0) { eof = true; return false; }

    bytes += n;
    ++chunks;
    out.offset = at;
    out.data = std::string_view(buf.data(), n);
    return true;
  }
};

ChunkReader::ChunkReader(ByteCursor& cursor)
  : ChunkReader(cursor, Config{}) {}

ChunkReader::ChunkReader(ByteCursor& cursor, Config cfg)
  : p_(new Impl(cursor, cfg)) {}

ChunkReader::~ChunkReader() { delete p_; }

bool ChunkReader::read_next(Chunk& out) { return p_->read_next(out); }

bool ChunkReader::for_each_chunk(const ChunkCallback& cb) {
  Chunk c;
  while (p_->read_next(c)) {
    if (!cb(c)) return false;
  }
  return true;
}

std::uint64_t ChunkReader::bytes_read() const noexcept { return p_->bytes; }
std::uint64_t ChunkReader::chunks_read() const noexcept { return p_->chunks; }

}
