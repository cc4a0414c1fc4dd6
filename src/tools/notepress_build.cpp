#include <exception>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "notepress/engine.hpp"
#include "notepress/logging.hpp"
#include "notepress/note_json.hpp"
#include "notepress/renderer.hpp"
#include "notepress/site_builder.hpp"

namespace {

namespace site = notepress::site;

struct CommandLine {
  bool dry_run = false;
  bool json = false;
  bool help = false;
  std::optional<std::string> root;
  std::optional<std::string> file;
};

void PrintUsage(std::ostream& out) {
  out << "Usage: notepress_build [--dry-run] [--json] [--root DIR] [--file PATH]\n"
      << "\n"
      << "  --dry-run   print each category's article list instead of writing pages\n"
      << "  --json      print one JSON record per note and exit\n"
      << "  --root DIR  site root (default: $NOTEPRESS_ROOT or .)\n"
      << "  --file PATH convert a single markdown file and print its HTML fragment\n";
}

CommandLine ParseCommandLine(int argc, char** argv) {
  CommandLine command;
  const std::vector<std::string> args(argv + 1, argv + argc);
  for (std::size_t i = 0; i < args.size(); ++i) {
    const auto& arg = args[i];
    if (arg == "--dry-run") {
      command.dry_run = true;
    } else if (arg == "--json") {
      command.json = true;
    } else if (arg == "-h" || arg == "--help") {
      command.help = true;
    } else if (arg == "--root" || arg == "--file") {
      if (i + 1 >= args.size()) {
        throw std::invalid_argument(arg + " requires a value");
      }
      (arg == "--root" ? command.root : command.file) = args[++i];
    } else {
      throw std::invalid_argument("Unknown argument: " + arg);
    }
  }
  return command;
}

int ConvertSingleFile(const std::filesystem::path& path, const notepress::markdown::Renderer& renderer,
                      bool as_json) {
  notepress::SourceDocument document{site::ReadTextFile(path), path.stem().string(), 1};
  const auto note = notepress::ConvertDocument(document, renderer);
  if (as_json) {
    std::cout << notepress::RenderedNoteToJson(note).dump(2) << std::endl;
  } else {
    std::cout << note.html_body << std::endl;
  }
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  notepress::logging::InitializeFromEnvironment();

  try {
    const auto command = ParseCommandLine(argc, argv);
    if (command.help) {
      PrintUsage(std::cout);
      return 0;
    }

    auto config = site::LoadBuildConfig();
    if (command.root) {
      config.root = *command.root;
    }
    const auto renderer = notepress::markdown::MakeRenderer(config.render.renderer,
                                                            config.render.block_options);

    if (command.file) {
      return ConvertSingleFile(*command.file, *renderer, command.json);
    }

    if (command.json) {
      for (const auto& note : site::CollectNotes(config.SourcePath(), *renderer)) {
        std::cout << notepress::RenderedNoteToJson(note).dump() << "\n";
      }
      std::cout.flush();
      return 0;
    }

    if (command.dry_run) {
      const auto grouped = site::GroupByCategory(site::CollectNotes(config.SourcePath(), *renderer));
      for (const auto& category : site::Categories()) {
        const auto it = grouped.find(category.key);
        std::cout << "\n=== " << category.key << " ===\n"
                  << site::BuildArticleList(it == grouped.end() ? std::vector<notepress::RenderedNote>{}
                                                                : it->second)
                  << "\n";
      }
      return 0;
    }

    const auto summary = site::BuildSite(config, *renderer);
    std::string stats;
    for (const auto& category : site::Categories()) {
      if (!stats.empty()) {
        stats += ", ";
      }
      stats += category.key + ": " + std::to_string(summary.per_category.at(category.key));
    }
    notepress::logging::LogInfo("Processed " + std::to_string(summary.notes) + " notes (" +
                                stats + "), removed " + std::to_string(summary.pages_removed) +
                                " stale pages");
  } catch (const std::invalid_argument& ex) {
    std::cerr << ex.what() << "\n";
    PrintUsage(std::cerr);
    return 2;
  } catch (const std::exception& ex) {
    notepress::logging::LogError(std::string{"Build failed: "} + ex.what());
    return 1;
  }
  return 0;
}
