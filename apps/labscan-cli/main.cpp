/**
 * labscan-cli: extract biomarkers from lab-report images / PDFs; output JSON.
 * Build: cmake -B build && cmake --build build
 * Run:   ./build/labscan_cli [--config path] [--backend mock|remote] --input path [--input path ...]
 * Each input's result is also written to output/<basename>.json.
 */

#include <labscan/app/config.hpp>
#include <labscan/app/logging.hpp>
#include <labscan/app/pipeline_factory.hpp>
#include <labscan/app/pipeline_runner.hpp>
#include <labscan/app/result_json.hpp>
#include <labscan/app/upload_policy.hpp>
#include <labscan/core/alias_table.hpp>
#include <labscan/core/document.hpp>
#include <labscan/vision/document_decoder.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <charconv>
#include <cstddef>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {

std::string content_type_for(const std::filesystem::path& path) {
  const std::string ext = labscan::core::to_lower(path.extension().string());
  if (ext == ".pdf") return "application/pdf";
  if (ext == ".png") return "image/png";
  if (ext == ".jpg" || ext == ".jpeg") return "image/jpeg";
  if (ext == ".gif") return "image/gif";
  if (ext == ".webp") return "image/webp";
  if (ext == ".tif" || ext == ".tiff") return "image/tiff";
  return "application/octet-stream";
}

/// "data:image/jpeg;base64,..." -> "image/jpeg"; plain base64 -> nullopt.
std::optional<std::string> data_url_mime(std::string_view payload) {
  if (!payload.starts_with("data:")) return std::nullopt;
  const auto end = payload.find_first_of(";,");
  if (end == std::string_view::npos) return std::nullopt;
  return std::string(payload.substr(5, end - 5));
}

std::optional<labscan::core::Document> read_document(const std::string& path, bool base64) {
  std::ifstream f(path, std::ios::binary);
  if (!f) {
    std::cerr << "Failed to open input: " << path << "\n";
    return std::nullopt;
  }
  const std::string content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());

  labscan::core::Document doc;
  doc.filename = std::filesystem::path(path).filename().string();
  if (base64) {
    auto bytes = labscan::vision::decode_base64_payload(content);
    if (!bytes) {
      std::cerr << "Invalid base64 payload: " << path << "\n";
      return std::nullopt;
    }
    doc.bytes = std::move(*bytes);
    doc.content_type = data_url_mime(labscan::core::trim_copy(content)).value_or("image/png");
  } else {
    doc.bytes.resize(content.size());
    std::transform(content.begin(), content.end(), doc.bytes.begin(),
                   [](char c) { return static_cast<std::byte>(c); });
    doc.content_type = content_type_for(path);
  }
  return doc;
}

void write_output(const std::string& input_path, const nlohmann::json& j) {
  const std::filesystem::path out_dir("output");
  std::error_code ec;
  std::filesystem::create_directories(out_dir, ec);
  const std::filesystem::path out_file =
      out_dir / (std::filesystem::path(input_path).stem().string() + ".json");
  std::ofstream f(out_file);
  if (f) {
    f << j.dump(2) << "\n";
  } else {
    std::cerr << "Warning: could not write " << out_file << "\n";
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  std::string config_path;
  std::vector<std::string> input_paths;
  std::string backend_override;  // "mock" or "remote"
  std::string log_level_override;
  std::optional<std::size_t> workers_override;
  bool base64 = false;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--input" && i + 1 < argc) {
      input_paths.emplace_back(argv[++i]);
    } else if (arg == "--backend" && i + 1 < argc) {
      backend_override = argv[++i];
    } else if (arg == "--log-level" && i + 1 < argc) {
      log_level_override = argv[++i];
    } else if (arg == "--workers" && i + 1 < argc) {
      const std::string value = argv[++i];
      std::size_t n = 0;
      const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), n);
      if (ec != std::errc() || ptr != value.data() + value.size()) {
        std::cerr << "Invalid --workers " << value << "\n";
        return 1;
      }
      workers_override = n;
    } else if (arg == "--base64") {
      base64 = true;
    } else if (arg == "--help" || arg == "-h") {
      std::cout << "Usage: labscan_cli [options] --input <path> [--input <path> ...]\n"
                << "  --config <path>     Pipeline config (key=value file); default: built-in (mock)\n"
                << "  --backend <type>    Override backend: mock | remote (default from config)\n"
                << "  --log-level <lvl>   trace | debug | info | warn | error | critical | off\n"
                << "  --workers <n>       Pages processed in parallel (0 = hardware concurrency)\n"
                << "  --base64            Inputs hold base64 image payloads (plain or data: URL)\n"
                << "  --input <path>      Document to extract; repeat for a bulk run\n"
                << "\nEnvironment: LABSCAN_LLM_BASE_URL, LABSCAN_LLM_API_KEY, LABSCAN_TEXT_MODEL,\n"
                << "LABSCAN_VISION_MODEL, LABSCAN_LOG_LEVEL override the config file.\n";
      return 0;
    } else {
      std::cerr << "Unknown argument " << arg << " (see --help)\n";
      return 1;
    }
  }

  labscan::app::PipelineConfig cfg = config_path.empty() ? labscan::app::default_config()
                                                         : labscan::app::load_config(config_path);
  labscan::app::apply_env_overrides(cfg);
  if (!log_level_override.empty()) cfg.log_level = log_level_override;
  if (workers_override) cfg.page_workers = *workers_override;
  labscan::app::configure_logging(cfg.log_level);

  if (!backend_override.empty()) {
    if (backend_override == "mock") {
      cfg.backend = labscan::app::BackendType::Mock;
    } else if (backend_override == "remote") {
      cfg.backend = labscan::app::BackendType::Remote;
    } else {
      std::cerr << "Unknown --backend " << backend_override << " (use mock or remote)\n";
      return 1;
    }
  }

  if (input_paths.empty()) {
    std::cerr << "No --input given (see --help)\n";
    return 1;
  }

  std::vector<labscan::core::Document> documents;
  for (const auto& path : input_paths) {
    auto doc = read_document(path, base64);
    if (!doc) return 1;
    documents.push_back(std::move(*doc));
  }

  try {
    const labscan::app::Backends backends = labscan::app::make_backends(cfg);
    labscan::core::Pipeline pipeline =
        labscan::app::build_pipeline(cfg, backends.engine, backends.chat);
    const labscan::vision::DocumentDecoder decoder = labscan::app::build_decoder(cfg, backends);

    labscan::app::RunOptions options;
    options.page_workers = cfg.page_workers;

    if (documents.size() == 1) {
      if (auto valid = labscan::app::validate_upload(documents.front(), cfg); !valid) {
        std::cerr << documents.front().filename << ": "
                  << labscan::app::to_string(valid.error()) << "\n";
        return 1;
      }
      const auto result =
          labscan::app::extract_document(decoder, pipeline, documents.front(), options);
      const nlohmann::json j = result;
      std::cout << j.dump(2) << "\n";
      write_output(input_paths.front(), j);
      return 0;
    }

    auto report = labscan::app::extract_documents(documents, decoder, pipeline, cfg, options);
    if (!report) {
      std::cerr << "Bulk run refused: " << labscan::app::to_string(report.error()) << "\n";
      return 1;
    }
    std::cout << nlohmann::json(*report).dump(2) << "\n";
    for (std::size_t i = 0; i < report->results.size(); ++i) {
      write_output(input_paths[i], nlohmann::json(report->results[i]));
    }
    return report->successful > 0 ? 0 : 2;
  } catch (const std::exception& e) {
    spdlog::critical("{}", e.what());
    return 1;
  }
}
