#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string>

#include "internal/storage/common/path_utils.hpp"
#include "internal/storage/disk/disk_output_sink.hpp"
#include "internal/util/errors.hpp"

namespace {

using acquisition::storage::DiskOutputSink;
using acquisition::storage::common::ResolveOutputPath;

std::filesystem::path TestDir(const std::string& name) {
  const auto dir = std::filesystem::temp_directory_path() / "acquisition_disk_output_sink_tests" / name;
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  return dir;
}

std::string ReadFile(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

void Write(DiskOutputSink& sink, const std::string& text) {
  sink.Write(reinterpret_cast<const std::uint8_t*>(text.data()), text.size());
}

void TestCommitRenamesTemporaryFile() {
  const auto dir   = TestDir("commit");
  const auto target = dir / "albums" / "track.flac";

  DiskOutputSink sink(target, true);
  Write(sink, "hello ");
  Write(sink, "world");

  assert(std::filesystem::exists(target.string() + ".tmp"));
  assert(!std::filesystem::exists(target));
  assert(sink.BytesWritten() == 11);

  sink.Commit();

  assert(std::filesystem::exists(target));
  assert(!std::filesystem::exists(target.string() + ".tmp"));
  assert(ReadFile(target) == "hello world");
}

void TestAbortRemovesPartialOutput() {
  const auto dir   = TestDir("abort");
  const auto target = dir / "track.flac";

  DiskOutputSink sink(target, false);
  Write(sink, "partial");
  sink.Abort();

  assert(!std::filesystem::exists(target));
  assert(!std::filesystem::exists(target.string() + ".tmp"));

  bool threw = false;
  try {
    Write(sink, "more");
  } catch (const acquisition::util::InvalidState&) {
    threw = true;
  }
  assert(threw && "closed sink must reject writes");
}

void TestResetDiscardsEarlierAttempt() {
  const auto dir   = TestDir("reset");
  const auto target = dir / "track.flac";

  DiskOutputSink sink(target, false);
  Write(sink, "first attempt, garbage");
  sink.Reset();
  assert(sink.BytesWritten() == 0);

  Write(sink, "second");
  sink.Commit();
  assert(ReadFile(target) == "second");
}

void TestEmptyCommitStillProducesFile() {
  const auto dir   = TestDir("empty");
  const auto target = dir / "silence.wav";

  DiskOutputSink sink(target, false);
  sink.Commit();

  assert(std::filesystem::exists(target));
  assert(std::filesystem::file_size(target) == 0);
}

void TestRemoteLocationIsCopiedIn() {
  const auto dir        = TestDir("remote");
  const auto downloaded = dir / "peer-client" / "song.mp3";
  std::filesystem::create_directories(downloaded.parent_path());
  {
    std::ofstream out(downloaded, std::ios::binary);
    out << "delivered by peer";
  }

  const auto     target = dir / "library" / "song.mp3";
  DiskOutputSink sink(target, false);
  sink.SetRemoteLocation(downloaded.string());
  sink.Commit();

  assert(ReadFile(target) == "delivered by peer");
  assert(sink.BytesWritten() == std::string("delivered by peer").size());
  // the peer client's copy is left alone
  assert(std::filesystem::exists(downloaded));
}

void TestMissingRemoteFileIsNotFound() {
  const auto dir = TestDir("remote_missing");

  DiskOutputSink sink(dir / "song.mp3", false);
  sink.SetRemoteLocation((dir / "nowhere.mp3").string());

  bool threw = false;
  try {
    sink.Commit();
  } catch (const acquisition::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestDiscardedSinkLeavesOtherWritersTmpAlone() {
  const auto dir   = TestDir("shared_path");
  const auto target = dir / "track.flac";

  DiskOutputSink running(target, false);
  Write(running, "in progress");

  {
    // duplicate submission: a second sink for the same path is created and dropped
    DiskOutputSink duplicate(target, false);
  }

  assert(std::filesystem::exists(target.string() + ".tmp"));
  running.Commit();
  assert(ReadFile(target) == "in progress");
}

void TestOutputPathResolution() {
  const std::filesystem::path root = "/srv/acquired";

  assert(ResolveOutputPath(root, "artist/album/01.flac") == root / "artist/album/01.flac");
  assert(ResolveOutputPath(root, "artist/./01.flac") == root / "artist/01.flac");

  for (const char* bad : {"", "/etc/passwd", "../escape.flac", "artist/../../escape.flac", "artist/", "."}) {
    bool threw = false;
    try {
      (void)ResolveOutputPath(root, bad);
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    assert(threw);
  }
}

} // namespace

int main() {
  TestCommitRenamesTemporaryFile();
  TestAbortRemovesPartialOutput();
  TestResetDiscardsEarlierAttempt();
  TestEmptyCommitStillProducesFile();
  TestRemoteLocationIsCopiedIn();
  TestMissingRemoteFileIsNotFound();
  TestDiscardedSinkLeavesOtherWritersTmpAlone();
  TestOutputPathResolution();

  std::cout << "acquisition_unit_disk_output_sink: pass\n";
  return 0;
}
