#include <labscan/extract/structured_parser.hpp>
#include <labscan/extract/marker_reply.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <stdexcept>
#include <utility>

namespace labscan::extract {

namespace lc = labscan::core;

namespace {

constexpr std::string_view kSystemPrompt =
    R"PROMPT(You are an expert at extracting biomarker data from lab report text. Your job is to find and extract ALL biomarkers/test results from the text, even if the OCR quality is imperfect.

IMPORTANT RULES:
1. Extract EVERY test result you can identify, even partial ones
2. For each biomarker, provide:
   - name: The biomarker name (use full standard names when possible)
   - value: The numeric result (must be a number)
   - unit: The unit of measurement (can be empty string if not visible)
   - reference_low: Lower bound of reference range (null if not shown)
   - reference_high: Upper bound of reference range (null if not shown)
   - flag: "H" if high/abnormal high, "L" if low/abnormal low, null otherwise

3. Common biomarker patterns to look for:
   - CBC: WBC, RBC, Hemoglobin, Hematocrit, Platelets, MCV, MCH, MCHC, RDW
   - Metabolic Panel: Glucose, BUN, Creatinine, Sodium, Potassium, Chloride, CO2, Calcium
   - Liver: AST, ALT, ALP, Bilirubin, Albumin, Total Protein
   - Lipids: Total Cholesterol, HDL, LDL, Triglycerides, VLDL, ApoB, Lp(a)
   - Thyroid: TSH, T3, T4, Free T3, Free T4
   - Diabetes: Glucose, HbA1c, Insulin
   - Inflammation: CRP, hs-CRP, ESR
   - Vitamins: Vitamin D, Vitamin B12, Folate
   - Iron: Iron, Ferritin, TIBC, Transferrin Saturation
   - Hormones: Testosterone, Estradiol, DHEA-S, Cortisol

4. Reference range formats to recognize:
   - "70-100", "70 - 100", "(70-100)", "[70-100]"
   - "< 100" means reference_high = 100
   - "> 40" means reference_low = 40
   - Some labs show ranges in separate columns

5. Flag indicators to recognize:
   - "H", "HIGH", "*", "↑" = flag "H"
   - "L", "LOW", "↓" = flag "L"
   - Text like "ABNORMAL" next to a value

Return ONLY valid JSON: {"markers": [...], "confidence": 0.0-1.0}
If no markers found: {"markers": [], "confidence": 0.0})PROMPT";

}  // namespace

StructuredParser::StructuredParser(std::shared_ptr<labscan::llm::IChatClient> client,
                                   const lc::AliasTable& aliases,
                                   StructuredParserConfig config)
    : client_(std::move(client)), aliases_(&aliases), config_(std::move(config)) {
  if (!client_) {
    throw std::invalid_argument("StructuredParser: chat client is null");
  }
}

std::string_view StructuredParser::system_prompt() noexcept { return kSystemPrompt; }

std::string StructuredParser::build_user_message(std::string_view raw_text) {
  std::string msg =
      "Extract all biomarkers from this lab report text. Look carefully for any test "
      "results even if the text is noisy from OCR:\n\n---\n";
  msg.append(raw_text);
  msg.append(
      "\n---\n\nReturn JSON with all markers found and a confidence score (0.0-1.0) "
      "based on text quality.");
  return msg;
}

std::expected<ParseOutcome, lc::PipelineError> StructuredParser::parse(
    std::string_view raw_text, std::stop_token stop) const {
  labscan::llm::ChatRequest request;
  request.model = config_.model;
  request.system_prompt = std::string(kSystemPrompt);
  request.user_text = build_user_message(raw_text);
  request.temperature = config_.temperature;
  request.timeout = config_.timeout;
  request.stop = std::move(stop);

  const auto completion = client_->complete(request);
  if (!completion) {
    return std::unexpected(completion.error());
  }

  auto reply = parse_marker_reply(completion->content, *aliases_);
  if (!reply) {
    return std::unexpected(reply.error());
  }

  ParseOutcome outcome;
  outcome.markers = std::move(reply->markers);
  const double fallback = outcome.markers.empty() ? 0.0 : 0.8;
  outcome.confidence = std::clamp(reply->confidence.value_or(fallback), 0.0, 1.0);
  spdlog::info("structured parser: {} markers, confidence {:.2f}", outcome.markers.size(),
               outcome.confidence);
  return outcome;
}

}  // namespace labscan::extract
