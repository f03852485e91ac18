#include <labscan/vision/tesseract_engine.hpp>
#include "page_cv_utils.hpp"
#include <labscan/core/error.hpp>
#include <labscan/core/page.hpp>
#include <opencv2/imgproc.hpp>
#include <tesseract/baseapi.h>
#include <spdlog/spdlog.h>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

namespace labscan::vision {

namespace {

using labscan::core::PipelineError;
using labscan::core::PixelFormat;

tesseract::PageSegMode to_psm(LayoutMode mode) {
  switch (mode) {
    case LayoutMode::SingleBlock:
      return tesseract::PSM_SINGLE_BLOCK;
    case LayoutMode::SingleColumn:
      return tesseract::PSM_SINGLE_COLUMN;
    case LayoutMode::AutoSegment:
    default:
      return tesseract::PSM_AUTO;
  }
}

/// Ends the API when the owning thread exits.
struct TessSession {
  tesseract::TessBaseAPI api;
  ~TessSession() { api.End(); }
};

/// Initialized API for this thread and (datapath, language); null if Init fails.
/// Init loads the language model, so each thread pays for it once.
tesseract::TessBaseAPI* thread_session(const std::string& datapath, const std::string& language) {
  thread_local std::map<std::pair<std::string, std::string>, std::unique_ptr<TessSession>>
      sessions;
  auto& slot = sessions[{datapath, language}];
  if (!slot) {
    auto session = std::make_unique<TessSession>();
    const char* path = datapath.empty() ? nullptr : datapath.c_str();
    if (session->api.Init(path, language.c_str(), tesseract::OEM_DEFAULT) != 0) {
      return nullptr;
    }
    slot = std::move(session);
  }
  return &slot->api;
}

}  // namespace

TesseractEngine::TesseractEngine(std::string language, std::string datapath)
    : language_(std::move(language)), datapath_(std::move(datapath)) {
  if (!thread_session(datapath_, language_)) {
    throw std::runtime_error("TesseractEngine: could not load language data '" + language_ + "'");
  }
}

std::expected<std::string, PipelineError> TesseractEngine::recognize(
    const labscan::core::Page& page, LayoutMode mode) {
  auto mat = detail::page_to_mat(page);
  if (!mat) {
    return std::unexpected(PipelineError::InvalidPage);
  }

  // Tesseract expects RGB channel order for colour input.
  cv::Mat input;
  if (page.format() == PixelFormat::BGR8) {
    cv::cvtColor(*mat, input, cv::COLOR_BGR2RGB);
  } else if (page.format() == PixelFormat::BGRA8) {
    cv::cvtColor(*mat, input, cv::COLOR_BGRA2RGBA);
  } else {
    input = *mat;
  }

  tesseract::TessBaseAPI* api = thread_session(datapath_, language_);
  if (!api) {
    spdlog::error("tesseract init failed for language '{}'", language_);
    return std::unexpected(PipelineError::RecognitionFailed);
  }
  api->SetPageSegMode(to_psm(mode));
  api->SetImage(input.data, input.cols, input.rows, input.channels(),
                static_cast<int>(input.step));

  std::unique_ptr<char[]> text(api->GetUTF8Text());
  api->Clear();
  if (!text) {
    return std::unexpected(PipelineError::RecognitionFailed);
  }
  return std::string(text.get());
}

}  // namespace labscan::vision
