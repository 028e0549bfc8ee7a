#include <cerrno>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <iterator>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <nlohmann/json.hpp>

#include "uv/common.h"
#include "uv/error.h"
#include "uv/orchestrator/config.h"
#include "uv/orchestrator/event_bus.h"
#include "uv/orchestrator/upload_service.h"

namespace {

  constexpr int kExitOk = 0;
  constexpr int kExitUsage = 64;
  constexpr int kExitDataErr = 65;
  constexpr int kExitNoInput = 66;
  constexpr int kExitUnavailable = 69;
  constexpr int kExitIO = 74;
  constexpr int kExitTempFail = 75;

  constexpr std::string_view kDefaultConfigPath = "config.json";

  void PrintUsage() {
    std::cerr << "UploadVault\n";
    std::cerr << "Usage:\n";
    std::cerr << "  uv [--config=<path>] <command> ...\n\n";
    std::cerr << "Commands:\n";
    std::cerr << "  uv upload-chunk --file-id=<id> --index=<n> --total=<n> [--size=<bytes>] [--md5=<hex>]\n"
                 "                  [--filename=<name>] [--relative-path=<path>] <chunk-file>\n";
    std::cerr << "  uv merge --file-id=<id> --filename=<name> --total=<n> [--relative-path=<path>] [--md5=<hex>]\n";
    std::cerr << "  uv status <file-id>\n";
    std::cerr << "  uv list\n";
    std::cerr << "  uv show <file-id>\n";
    std::cerr << "  uv delete <file-id>\n";
    std::cerr << "  uv pause <file-id>\n";
    std::cerr << "  uv resume <file-id>\n";
    std::cerr << "  uv resume-failed\n";
    std::cerr << "  uv failed\n";
    std::cerr << "  uv cleanup [--status=<status>] [--older-than-hours=<n>]\n";
    std::cerr << "  uv create-folder --name=<folder> <manifest.json>\n";
    std::cerr << "  uv summary <folder-id>\n";
    std::cerr << "  uv sub-tasks <folder-id>\n";
  }

  struct ParsedArgs {
    std::map<std::string, std::string, std::less<>> flags;
    std::vector<std::string> positional;

    [[nodiscard]] std::optional<std::string> Flag(std::string_view name) const {
      auto it = flags.find(name);
      if (it == flags.end()) {
        return std::nullopt;
      }
      return it->second;
    }
  };

  // Splits `--key=value` flags from positional arguments.
  std::optional<ParsedArgs> ParseCommandArgs(int argc, char** argv, int index) {
    ParsedArgs parsed;
    for (; index < argc; ++index) {
      std::string_view arg = argv[index];
      if (arg.rfind("--", 0) == 0) {
        auto eq = arg.find('=');
        if (eq == std::string_view::npos || eq == 2) {
          return std::nullopt;
        }
        parsed.flags.insert_or_assign(std::string(arg.substr(2, eq - 2)), std::string(arg.substr(eq + 1)));
        continue;
      }
      parsed.positional.emplace_back(arg);
    }
    return parsed;
  }

  template <typename T>
  std::optional<T> ParseNumber(std::string_view text) {
    T value{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || ec != std::errc() || ptr != text.data() + text.size()) {
      return std::nullopt;
    }
    return value;
  }

  template <typename T>
  std::optional<T> NumberFlag(const ParsedArgs& args, std::string_view name) {
    auto text = args.Flag(name);
    if (!text) {
      return std::nullopt;
    }
    return ParseNumber<T>(*text);
  }

  std::vector<uint8_t> ReadWholeFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
      throw uv::Error{uv::ErrorDomain::IO, ENOENT, "Unable to open " + uv::PathToUtf8String(path), ENOENT};
    }
    std::vector<uint8_t> data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
      throw uv::Error{uv::ErrorDomain::IO, EIO, "Failed reading " + uv::PathToUtf8String(path), EIO,
                      uv::Retryability::kTransient};
    }
    return data;
  }

  void PrintJson(const nlohmann::json& doc) { std::cout << doc.dump(2) << std::endl; }

  const char* DomainPrefix(uv::ErrorDomain domain) {
    switch (domain) {
    case uv::ErrorDomain::Validation:
      return "Validation error";
    case uv::ErrorDomain::NotFound:
      return "Not found";
    case uv::ErrorDomain::Conflict:
      return "Conflict";
    case uv::ErrorDomain::Integrity:
      return "Integrity error";
    case uv::ErrorDomain::IO:
      return "I/O error";
    case uv::ErrorDomain::Persistence:
      return "Persistence error";
    case uv::ErrorDomain::Cancelled:
      return "Cancelled";
    case uv::ErrorDomain::State:
      return "State error";
    case uv::ErrorDomain::Config:
      return "Configuration error";
    case uv::ErrorDomain::Internal:
      return "Internal error";
    }
    return "Error";
  }

  void ReportError(const uv::Error& err) {
    std::cerr << DomainPrefix(err.domain) << ": " << err.what() << '\n';

    uv::orchestrator::Event event;
    event.category = uv::orchestrator::EventCategory::kDiagnostics;
    event.severity = uv::orchestrator::EventSeverity::kError;
    event.event_id = "cli_error";
    event.message = err.what();
    event.fields.emplace_back("domain", uv::ErrorDomainName(err.domain));
    event.fields.emplace_back("code", std::to_string(err.code), uv::orchestrator::FieldPrivacy::kPublic, true);
    if (err.native_code.has_value()) {
      event.fields.emplace_back("native_code", std::to_string(*err.native_code),
                                uv::orchestrator::FieldPrivacy::kPublic, true);
    }
    try {
      uv::orchestrator::EventBus::Instance().Publish(event);
    } catch (const std::exception& publish_error) {
      std::clog << "{\"event\":\"eventbus_error\",\"message\":\"error report publish failed\",\"detail\":\""
                << publish_error.what() << "\"}" << std::endl;
    }
  }

  int ExitCodeFor(const uv::Error& err) {
    switch (err.domain) {
    case uv::ErrorDomain::Validation:
    case uv::ErrorDomain::Config:
      return kExitUsage;
    case uv::ErrorDomain::NotFound:
      return kExitNoInput;
    case uv::ErrorDomain::Integrity:
      return kExitDataErr;
    case uv::ErrorDomain::Conflict:
      return kExitUnavailable;
    case uv::ErrorDomain::Cancelled:
      return kExitTempFail;
    case uv::ErrorDomain::State:
      return err.code == uv::errors::state::kIncompleteUpload ? kExitTempFail : kExitUsage;
    case uv::ErrorDomain::IO:
    case uv::ErrorDomain::Persistence:
    case uv::ErrorDomain::Internal:
    default:
      return kExitIO;
    }
  }

  int HandleUploadChunk(uv::orchestrator::UploadService& service, const ParsedArgs& args) {
    auto file_id = args.Flag("file-id");
    auto index = NumberFlag<int>(args, "index");
    auto total = NumberFlag<int>(args, "total");
    if (!file_id || !index || !total || args.positional.size() != 1) {
      PrintUsage();
      return kExitUsage;
    }
    int64_t size = 0;
    if (auto text = args.Flag("size")) {
      auto parsed = ParseNumber<int64_t>(*text);
      if (!parsed) {
        PrintUsage();
        return kExitUsage;
      }
      size = *parsed;
    }

    const auto data = ReadWholeFile(args.positional.front());
    uv::orchestrator::ChunkRequest request;
    request.file_id = *file_id;
    request.index = *index;
    request.total_chunks = *total;
    request.file_size = size;
    request.data = data;
    request.expected_md5 = args.Flag("md5").value_or("");
    request.file_name = args.Flag("filename").value_or("");
    request.relative_path = args.Flag("relative-path").value_or("");

    const auto result = service.UploadChunk(request);
    PrintJson({{"status", "ok"},
               {"file_id", request.file_id},
               {"chunk_index", result.index},
               {"md5_checked", result.md5_checked},
               {"size", result.size},
               {"duplicate", result.duplicate},
               {"md5", result.md5}});
    return kExitOk;
  }

  int HandleMerge(uv::orchestrator::UploadService& service, const ParsedArgs& args) {
    auto file_id = args.Flag("file-id");
    auto file_name = args.Flag("filename");
    auto total = NumberFlag<int>(args, "total");
    if (!file_id || !file_name || !total || !args.positional.empty()) {
      PrintUsage();
      return kExitUsage;
    }
    uv::orchestrator::MergeRequest request;
    request.file_id = *file_id;
    request.file_name = *file_name;
    request.total_chunks = *total;
    request.relative_path = args.Flag("relative-path").value_or("");
    request.expected_md5 = args.Flag("md5").value_or("");

    const auto result = service.Merge(request);
    PrintJson({{"status", "ok"},
               {"file_path", uv::PathToUtf8String(result.file_path)},
               {"md5", result.md5},
               {"relative_path", request.relative_path},
               {"size", result.size},
               {"merge_time_ms", result.duration.count()}});
    return kExitOk;
  }

  int HandleCleanup(uv::orchestrator::UploadService& service, const ParsedArgs& args) {
    uv::storage::CleanupFilter filter;
    if (auto status = args.Flag("status")) {
      filter.status = uv::storage::ParseTaskStatus(*status);
      if (!filter.status) {
        std::cerr << "Validation error: unknown status '" << *status << "'" << std::endl;
        return kExitUsage;
      }
    }
    if (auto hours = args.Flag("older-than-hours")) {
      auto parsed = ParseNumber<long>(*hours);
      if (!parsed || *parsed < 0) {
        PrintUsage();
        return kExitUsage;
      }
      filter.min_age = std::chrono::hours(*parsed);
    }
    const bool default_policy = filter.empty();
    const auto removed = service.Cleanup(filter);
    PrintJson({{"status", "ok"},
               {"policy", default_policy ? "expired" : "filter"},
               {"cleaned_count", removed.size()},
               {"cleaned", removed}});
    return kExitOk;
  }

  int HandleCreateFolder(uv::orchestrator::UploadService& service, const ParsedArgs& args) {
    auto name = args.Flag("name");
    if (!name || args.positional.size() != 1) {
      PrintUsage();
      return kExitUsage;
    }
    const auto raw = ReadWholeFile(args.positional.front());
    nlohmann::json manifest;
    try {
      manifest = nlohmann::json::parse(raw.begin(), raw.end());
    } catch (const nlohmann::json::parse_error& ex) {
      std::cerr << "Validation error: manifest is not valid JSON: " << ex.what() << std::endl;
      return kExitUsage;
    }
    const auto& files_json = manifest.is_object() && manifest.contains("files") ? manifest.at("files") : manifest;
    if (!files_json.is_array()) {
      std::cerr << "Validation error: manifest must be an array of files or an object with \"files\"" << std::endl;
      return kExitUsage;
    }
    std::vector<uv::storage::FileDescriptor> files;
    try {
      files = files_json.get<std::vector<uv::storage::FileDescriptor>>();
    } catch (const nlohmann::json::exception& ex) {
      std::cerr << "Validation error: malformed file entry: " << ex.what() << std::endl;
      return kExitUsage;
    }

    const auto folder = service.CreateFolderTask(*name, files);
    PrintJson({{"status", "ok"},
               {"folder_task_id", folder.file_id},
               {"folder_name", *name},
               {"task", folder},
               {"sub_tasks", service.SubTasks(folder.file_id)}});
    return kExitOk;
  }

  // Commands taking exactly one task id.
  int HandleSingleId(uv::orchestrator::UploadService& service, const std::string& cmd, const ParsedArgs& args) {
    if (args.positional.size() != 1 || !args.flags.empty()) {
      PrintUsage();
      return kExitUsage;
    }
    const std::string& id = args.positional.front();
    if (cmd == "status") {
      const auto report = service.Status(id);
      PrintJson(report);
      return report.found ? kExitOk : kExitNoInput;
    }
    if (cmd == "show") {
      PrintJson(service.GetTask(id));
      return kExitOk;
    }
    if (cmd == "delete") {
      service.DeleteTask(id);
      PrintJson({{"status", "ok"}, {"deleted", id}});
      return kExitOk;
    }
    if (cmd == "pause") {
      service.PauseTask(id);
      PrintJson({{"status", "ok"}, {"paused", id}});
      return kExitOk;
    }
    if (cmd == "resume") {
      service.ResumeTask(id);
      PrintJson({{"status", "ok"}, {"resumed", id}});
      return kExitOk;
    }
    if (cmd == "summary") {
      PrintJson(service.FolderSummary(id));
      return kExitOk;
    }
    if (cmd == "sub-tasks") {
      PrintJson(service.SubTasks(id));
      return kExitOk;
    }
    PrintUsage();
    return kExitUsage;
  }

  int Dispatch(uv::orchestrator::UploadService& service, const std::string& cmd, const ParsedArgs& args) {
    if (cmd == "upload-chunk") {
      return HandleUploadChunk(service, args);
    }
    if (cmd == "merge") {
      return HandleMerge(service, args);
    }
    if (cmd == "cleanup") {
      return HandleCleanup(service, args);
    }
    if (cmd == "create-folder") {
      return HandleCreateFolder(service, args);
    }
    if (cmd == "list" || cmd == "failed" || cmd == "resume-failed") {
      if (!args.positional.empty() || !args.flags.empty()) {
        PrintUsage();
        return kExitUsage;
      }
      if (cmd == "list") {
        PrintJson({{"tasks", service.ListTasks()}});
      } else if (cmd == "failed") {
        PrintJson({{"tasks", service.ListFailed()}});
      } else {
        const auto resumed = service.ResumeAllFailed();
        PrintJson({{"status", "ok"}, {"resumed_count", resumed.size()}, {"resumed", resumed}});
      }
      return kExitOk;
    }
    return HandleSingleId(service, cmd, args);
  }

} // namespace

int main(int argc, char** argv) {
  try {
    if (argc < 2) {
      PrintUsage();
      return kExitUsage;
    }

    std::filesystem::path config_path{std::string(kDefaultConfigPath)};
    int index = 1;
    for (; index < argc; ++index) {
      std::string_view arg = argv[index];
      if (arg.rfind("--", 0) != 0) {
        break;
      }
      if (arg.rfind("--config=", 0) == 0) {
        auto value = arg.substr(std::string_view("--config=").size());
        if (value.empty()) {
          PrintUsage();
          return kExitUsage;
        }
        config_path = std::string(value);
        continue;
      }
      PrintUsage();
      return kExitUsage;
    }

    if (index >= argc) {
      PrintUsage();
      return kExitUsage;
    }

    std::string cmd = argv[index++];
    auto args = ParseCommandArgs(argc, argv, index);
    if (!args) {
      PrintUsage();
      return kExitUsage;
    }

    auto config = uv::orchestrator::LoadConfig(config_path);
    uv::orchestrator::UploadService service(std::move(config));
    service.Start(false);
    const int rc = Dispatch(service, cmd, *args);
    service.Stop();
    return rc;
  } catch (const uv::Error& err) {
    ReportError(err);
    return ExitCodeFor(err);
  } catch (const std::exception& err) {
    std::cerr << "I/O error: " << err.what() << std::endl;
    return kExitIO;
  }
}
