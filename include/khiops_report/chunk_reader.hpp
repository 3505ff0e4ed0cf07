#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <string_view>

namespace kr {

class ByteCursor;

struct Chunk {
  std::uint64_t offset = 0;   // absolute offset of data[0]
  std::string_view data;
};

class ChunkReader {
public:
  struct Config {
    std::size_t   chunk_bytes = 512 * 1024;                               // 512 KiB
    std::uint64_t limit       = std::numeric_limits<std::uint64_t>::max(); // bytes from start
  };

  // Reads from the cursor's current position; the cursor must outlive the reader.
  explicit ChunkReader(ByteCursor& cursor);
  ChunkReader(ByteCursor& cursor, Config cfg);
  ~ChunkReader();

  ChunkReader(const ChunkReader&) = delete;
  ChunkReader& operator=(const ChunkReader&) = delete;

  // Next chunk; false once the source or the limit is exhausted. The view is
  // valid until the following call.
  bool read_next(Chunk& out);

  using ChunkCallback = std::function<bool(const Chunk&)>;

  // Stops early when the callback returns false.
  bool for_each_chunk(const ChunkCallback& cb);

  std::uint64_t bytes_read() const noexcept;
  std::uint64_t chunks_read() const noexcept;

private:
  struct Impl; Impl* p_;
};

}
