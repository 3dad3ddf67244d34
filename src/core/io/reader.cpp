// File: src/core/io/reader.cpp
#include "ts/core/io/reader.hpp"

#include <exception>

#include "ts/core/log.hpp"

namespace ts {

Status ScopedReaders::open(Reader& reader) {
  TS_RETURN_IF_ERROR(reader.open());
  opened_.push_back(&reader);
  return Status::ok_status();
}

void ScopedReaders::close_all() noexcept {
  // Reverse order of opening.
  for (auto it = opened_.rbegin(); it != opened_.rend(); ++it) {
    try {
      (*it)->close();
    } catch (const std::exception& e) {
      log::error("Reader {} failed to close: {}", (*it)->name(), e.what());
    }
  }
  opened_.clear();
}

}  // namespace ts
