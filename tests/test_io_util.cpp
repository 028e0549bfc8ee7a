#include "uv/orchestrator/io_util.h"

#include <filesystem>
#include <iostream>
#include <span>
#include <stdexcept>
#include <string>

#include "test_support.h"
#include "uv/common.h"
#include "uv/crypto/md5.h"
#include "uv/error.h"

namespace {

  using uv::orchestrator::AtomicReplace;
  using uv::orchestrator::AtomicReplaceHooks;
  using uv::orchestrator::AtomicWriter;
  using uv::orchestrator::WriteMode;
  using uv::testing::Check;
  using uv::testing::CountEntries;
  using uv::testing::ReadText;
  using uv::testing::TempDir;
  using uv::testing::WriteText;

  void TestAtomicReplaceSurvivesCrashBeforeRename() {
    TempDir dir("uv_atomic_replace");
    auto target = dir.path() / "record.json";
    WriteText(target, "baseline");

    AtomicReplaceHooks hooks;
    hooks.before_rename = [](const std::filesystem::path& staged, const std::filesystem::path&) {
      Check(ReadText(staged) == "update", "staged file must hold the complete payload");
      throw std::runtime_error("simulated crash");
    };

    bool threw = false;
    try {
      AtomicReplace(target, uv::AsBytes("update"), hooks);
    } catch (const uv::Error&) {
      threw = true;
    }
    Check(threw, "Expected simulated crash before rename");
    Check(ReadText(target) == "baseline", "Target must keep its previous content");
    Check(CountEntries(dir.path()) == 2, "Staging file must be removed after a failed replace");

    AtomicReplace(target, uv::AsBytes("update"));
    Check(ReadText(target) == "update", "Replace without hooks must publish the payload");
  }

  void TestWriterCommitPublishesContentAndDigest() {
    TempDir dir("uv_atomic_writer");
    auto target = dir.path() / "nested" / "out.bin";

    AtomicWriter writer;
    writer.Open(target);
    Check(writer.staging_path() != target, "Atomic mode must stage beside the target");
    writer.Write(uv::AsBytes("hello "));
    writer.Write(uv::AsBytes("world"));
    Check(!std::filesystem::exists(target), "Target must not be visible before commit");
    writer.Commit();

    Check(ReadText(target) == "hello world", "Committed content mismatch");
    Check(writer.Size() == 11, "Writer size must count every byte");
    Check(writer.Digest() == uv::crypto::Md5Hex(std::string_view("hello world")),
          "Writer digest must match the written bytes");
    Check(CountEntries(target.parent_path()) == 1, "No staging file may survive a commit");
  }

  void TestWriterRollbackLeavesTargetUntouched() {
    TempDir dir("uv_atomic_rollback");
    auto target = dir.path() / "out.bin";
    WriteText(target, "old");

    {
      AtomicWriter writer;
      writer.Open(target);
      writer.Write(uv::AsBytes("partial"));
      // destructor rolls back
    }
    Check(ReadText(target) == "old", "Abandoned writer must not touch the target");
    Check(CountEntries(dir.path()) == 1, "Abandoned writer must remove its staging file");

    AtomicReplaceHooks hooks;
    hooks.before_rename = [](const std::filesystem::path&, const std::filesystem::path&) {
      throw std::runtime_error("simulated crash");
    };
    AtomicWriter crashing(WriteMode::kAtomic, hooks);
    crashing.Open(target);
    crashing.Write(uv::AsBytes("new content"));
    bool threw = false;
    try {
      crashing.Commit();
    } catch (const uv::Error&) {
      threw = true;
    }
    Check(threw, "Commit must surface the hook failure");
    Check(ReadText(target) == "old", "Crash before rename must keep the old content");
    Check(CountEntries(dir.path()) == 1, "Crash before rename must clean the staging file");
  }

  void TestDirectModeWritesInPlace() {
    TempDir dir("uv_direct_writer");
    auto target = dir.path() / "out.bin";

    AtomicWriter writer(WriteMode::kDirect);
    writer.Open(target);
    Check(writer.staging_path() == target, "Direct mode writes straight into the target");
    writer.Write(uv::AsBytes("direct"));
    writer.Commit();
    Check(ReadText(target) == "direct", "Direct mode content mismatch");

    AtomicWriter abandoned(WriteMode::kDirect);
    abandoned.Open(dir.path() / "partial.bin");
    abandoned.Write(uv::AsBytes("half"));
    abandoned.Rollback();
    Check(!std::filesystem::exists(dir.path() / "partial.bin"), "Direct rollback must remove the partial file");
  }

  void TestWriteWithoutOpenFails() {
    AtomicWriter writer;
    bool threw = false;
    try {
      writer.Write(uv::AsBytes("data"));
    } catch (const uv::Error& err) {
      threw = err.domain == uv::ErrorDomain::IO && err.code == uv::errors::io::kWriterNotOpen;
    }
    Check(threw, "Write on a closed writer must raise kWriterNotOpen");
  }

} // namespace

int main() {
  TestAtomicReplaceSurvivesCrashBeforeRename();
  TestWriterCommitPublishesContentAndDigest();
  TestWriterRollbackLeavesTargetUntouched();
  TestDirectModeWritesInPlace();
  TestWriteWithoutOpenFails();
  std::cout << "atomic write tests ok\n";
  return 0;
}
