// File: include/ts/core/io/reader.hpp
#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "ts/core/io/transformer.hpp"
#include "ts/core/model/buffer_data.hpp"
#include "ts/core/status.hpp"
#include "ts/core/types.hpp"

namespace ts {

// Incremental, non-blocking data source.
//
// Lifecycle: get_initial() may be called before open(). open() acquires files,
// sockets, etc. close() releases them and must be safe to call more than once.
class Reader {
 public:
  virtual ~Reader() = default;

  virtual Status open() { return Status::ok_status(); }
  virtual void close() {}

  // Result names and empty-shaped data this reader will produce.
  // No I/O beyond what's needed to discover shapes.
  virtual Result<BufferDataMap> get_initial() = 0;

  // Read or poll once. Must not block.
  // Returns:
  //  - OK with results keyed like get_initial()
  //  - OK and empty when nothing is ready yet
  //  - out_of_range("eof") when the source is exhausted
  //  - other error codes on failure
  virtual Result<BufferDataMap> read_next() = 0;

  // Implementation name, for logs.
  virtual std::string name() const = 0;
};

// Where one reader result goes: result name -> transformers -> buffer name.
struct ReaderRoute {
  std::string reader_result_name;
  BufferName buffer_name;
  std::vector<std::shared_ptr<const Transformer>> transformers;
};

// How a reader finds clock sync events, and who it reports them as.
struct ReaderSyncConfig {
  // This reader's clock is the reference the others are aligned to.
  bool is_reference{false};

  // Result holding sync events, must be a NumericEventList. Without an
  // event_value this reader records nothing and only borrows drift estimates.
  std::string reader_result_name;
  std::optional<double> event_value;
  std::size_t event_value_index{0};

  // Identity to record sync events under. Usually the reader's own name, but
  // a reader may borrow sync from an upstream reader by naming it here.
  ReaderName reader_name;
};

// Opens readers and closes every one that was opened, on every exit path.
class ScopedReaders {
 public:
  ScopedReaders() = default;
  ~ScopedReaders() { close_all(); }

  ScopedReaders(const ScopedReaders&) = delete;
  ScopedReaders& operator=(const ScopedReaders&) = delete;

  // On failure nothing new is tracked; readers opened earlier stay open until close_all().
  Status open(Reader& reader);

  void close_all() noexcept;

  [[nodiscard]] std::size_t size() const noexcept { return opened_.size(); }

 private:
  std::vector<Reader*> opened_;
};

}  // namespace ts
