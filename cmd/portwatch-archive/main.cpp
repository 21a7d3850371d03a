#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#include "internal/archive/legacy_archive.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"

static void Usage() {
  std::cerr << "Usage:\n"
            << "  portwatch-archive --config <config.yaml> import <file.json>\n"
            << "  portwatch-archive --config <config.yaml> export <file.json|->\n";
}

int main(int argc, char** argv) {
  if (argc != 5 || std::string(argv[1]) != "--config") {
    Usage();
    return 1;
  }

  const std::string config_path = argv[2];
  const std::string cmd         = argv[3];
  const std::string file        = argv[4];

  if (cmd != "import" && cmd != "export") {
    Usage();
    return 1;
  }

  try {
    auto config = portwatch::config::ConfigLoader::LoadFromYaml(config_path);
    portwatch::observability::InitializeLogging(config);

    auto repository = portwatch::factory::BuildRepository(config);

    if (cmd == "import") {
      std::ifstream in(file);
      if (!in) {
        std::cerr << "cannot open " << file << "\n";
        return 1;
      }
      std::stringstream buffer;
      buffer << in.rdbuf();

      const auto report = portwatch::archive::ImportLegacyJson(*repository, buffer.str());
      std::cout << "facts=" << report.facts_imported << " facts_skipped=" << report.facts_skipped
                << " events=" << report.events_imported << " events_skipped=" << report.events_skipped
                << " notes=" << report.notes_imported << "\n";
    } else {
      const auto json = portwatch::archive::ExportLegacyJson(*repository);
      if (file == "-") {
        std::cout << json;
      } else {
        std::ofstream out(file, std::ios::trunc);
        if (!out || !(out << json)) {
          std::cerr << "cannot write " << file << "\n";
          return 1;
        }
      }
    }

    portwatch::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    PORTWATCH_LOG_ERROR("archive failed", {portwatch::observability::StringField("error", e.what())});
    portwatch::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
