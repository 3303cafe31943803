#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "internal/comments/comment_ledger.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/storage/atomic_file.hpp"
#include "internal/storage/common/path_grammar.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

using alerts::model::RecordPath;

static void Usage() {
  std::cout << "Usage:\n"
            << "  alertctl <config.yaml> create <lat> <lon> <title> [--body TEXT] [--at ISO8601] [--signature SIG] [--meta KEY=VALUE]...\n"
            << "  alertctl <config.yaml> attach <record-path> <file>\n"
            << "  alertctl <config.yaml> comment <record-path> <text> [--at ISO8601] [--signature SIG]\n"
            << "  alertctl <config.yaml> expire <record-path>\n"
            << "  alertctl <config.yaml> close <record-path>\n"
            << "  alertctl <config.yaml> sweep\n"
            << "  alertctl <config.yaml> show <record-path>\n"
            << "  alertctl <config.yaml> list [active|expired]\n"
            << "  alertctl <config.yaml> apply <payload.syncpb>\n";
}

namespace {

struct Options {
  std::optional<std::string>                       body;
  std::optional<std::string>                       at;
  std::optional<std::string>                       signature;
  std::vector<std::pair<std::string, std::string>> metadata;
};

// Parses --flag VALUE pairs starting at argv[first].
std::optional<Options> ParseOptions(int argc, char** argv, int first) {
  Options options;
  for (int i = first; i < argc; ++i) {
    const std::string flag = argv[i];
    if (i + 1 >= argc) {
      std::cerr << "missing value for " << flag << "\n";
      return std::nullopt;
    }
    const std::string value = argv[++i];

    if (flag == "--body") {
      options.body = value;
    } else if (flag == "--at") {
      options.at = value;
    } else if (flag == "--signature") {
      options.signature = value;
    } else if (flag == "--meta") {
      const auto eq = value.find('=');
      if (eq == std::string::npos || eq == 0) {
        std::cerr << "expected KEY=VALUE: " << value << "\n";
        return std::nullopt;
      }
      options.metadata.emplace_back(value.substr(0, eq), value.substr(eq + 1));
    } else {
      std::cerr << "unknown option: " << flag << "\n";
      return std::nullopt;
    }
  }
  return options;
}

void PrintPayload(const alerts::v1::SyncPayload& payload) {
  std::cout << "path=" << payload.path() << "\n";
  if (!payload.file_name().empty()) std::cout << "file=" << payload.file_name() << "\n";
  std::cout << "payload=" << payload.id() << "\n";
}

void PrintLifecycle(const std::optional<alerts::v1::SyncPayload>& payload) {
  if (!payload) {
    std::cout << "already expired\n";
    return;
  }
  PrintPayload(*payload);
}

} // namespace

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  const std::string config_path = argv[1];
  const std::string cmd         = argv[2];

  try {
    auto config = alerts::config::ConfigLoader::LoadFromYaml(config_path);
    alerts::observability::InitializeLogging(config);

    auto  deps      = alerts::factory::BuildRuntime(config);
    auto& authoring = *deps.authoring;

    // ------------------------------------------------------------

    if (cmd == "create") {
      if (argc < 6) {
        Usage();
        return 1;
      }

      auto options = ParseOptions(argc, argv, 6);
      if (!options) return 1;

      alerts::model::AlertRecord record;
      record.coordinates.lat = std::stod(argv[3]);
      record.coordinates.lon = std::stod(argv[4]);
      record.title           = argv[5];
      record.body            = options->body.value_or("");
      record.created_at      = options->at ? alerts::util::ParseIso8601(*options->at) : alerts::util::Now();
      record.signature       = options->signature.value_or("");
      record.metadata        = options->metadata;

      PrintPayload(authoring.CreateRecord(std::move(record)));
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "attach") {
      if (argc < 5) {
        Usage();
        return 1;
      }

      const auto path     = alerts::storage::common::ParseRecordPath(argv[3]);
      const auto source   = std::filesystem::path(argv[4]);
      const auto bytes    = alerts::storage::ReadFile(source);
      const auto response = authoring.Attach(path, source.filename().string(), bytes);

      PrintPayload(response.payload);
      if (response.attach.deduplicated) std::cout << "deduplicated=true\n";
      if (response.attach.extension_coerced) std::cout << "extension_coerced=true\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "comment") {
      if (argc < 5) {
        Usage();
        return 1;
      }

      auto options = ParseOptions(argc, argv, 5);
      if (!options) return 1;

      alerts::model::Comment comment;
      comment.body       = argv[4];
      comment.created_at = options->at ? alerts::util::ParseIso8601(*options->at) : alerts::util::Now();
      comment.signature  = options->signature.value_or("");
      comment.metadata   = options->metadata;

      PrintPayload(authoring.AddComment(alerts::storage::common::ParseRecordPath(argv[3]), std::move(comment)));
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "expire") {
      if (argc < 4) {
        Usage();
        return 1;
      }

      PrintLifecycle(authoring.Expire(alerts::storage::common::ParseRecordPath(argv[3]), alerts::util::Now()));
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "close") {
      if (argc < 4) {
        Usage();
        return 1;
      }

      PrintLifecycle(authoring.Close(alerts::storage::common::ParseRecordPath(argv[3])));
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "sweep") {
      const auto payloads = authoring.Sweep(alerts::util::Now());
      for (const auto& payload : payloads) std::cout << payload.path() << "\n";
      std::cout << "expired=" << payloads.size() << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "show") {
      if (argc < 4) {
        Usage();
        return 1;
      }

      const auto requested = alerts::storage::common::ParseRecordPath(argv[3]);
      const auto path      = deps.store->Resolve(requested);
      if (!path) throw alerts::util::NotFound("record not found: " + requested.ToString());

      const auto record = deps.store->Read(*path);
      std::cout << "path=" << path->ToString() << "\n"
                << "title=" << record.title << "\n"
                << "author=" << record.author << "\n"
                << "created=" << alerts::util::FormatIso8601(record.created_at) << "\n"
                << "expires=" << alerts::util::FormatIso8601(deps.lifecycle->ExpiresAt(record)) << "\n";

      for (const auto& name : deps.attachments->List(*path)) std::cout << "image=" << name << "\n";
      for (const auto& stored : deps.comments->List(*path)) {
        std::cout << "comment=" << stored.file_name << " " << stored.comment.author << ": " << stored.comment.body << "\n";
      }
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "list") {
      std::optional<alerts::model::LifecycleState> state;
      if (argc >= 4) {
        state = alerts::model::ParseLifecycleState(argv[3]);
        if (!state) {
          std::cerr << "unknown state: " << argv[3] << "\n";
          return 1;
        }
      }

      for (const auto& path : deps.store->List(state)) std::cout << path.ToString() << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "apply") {
      if (argc < 4) {
        Usage();
        return 1;
      }

      const auto           file = std::filesystem::absolute(argv[3]);
      alerts::spool::Spool source(file.parent_path(), config.storage().fsync());
      const auto           payload = source.Load(file);
      const auto           result  = deps.replicator->Apply(payload);

      std::cout << "outcome=" << alerts::sync::ToString(result.outcome) << "\n"
                << "path=" << result.target.ToString() << "\n";
      if (!result.conflict_path.empty()) std::cout << "conflict=" << result.conflict_path.string() << "\n";
      return result.outcome == alerts::sync::ApplyOutcome::kConflict ? 3 : 0;
    }

    Usage();
    return 1;
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    alerts::observability::ShutdownLogging();
    return 2;
  }
}
