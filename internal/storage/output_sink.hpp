#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace acquisition::storage {

/*
  Destination of one acquisition job.

  Written by a single job at a time. A job always ends the sink with
  exactly one Commit() or Abort(); Reset() discards partial output
  before a retry.
*/
class OutputSink {
 public:
  virtual ~OutputSink() = default;

  virtual void Write(const std::uint8_t* data, std::size_t size) = 0;

  virtual void Reset() = 0;

  // The payload was delivered out of band to `path` (peer transfers).
  virtual void SetRemoteLocation(const std::string& path) = 0;

  virtual void Commit() = 0;

  virtual void Abort() noexcept = 0;

  virtual std::uint64_t BytesWritten() const = 0;

  virtual std::string Describe() const = 0;
};

} // namespace acquisition::storage
