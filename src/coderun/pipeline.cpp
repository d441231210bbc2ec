#include <coderun/pipeline.h>

#include <nlohmann/json.hpp>

#include <coderun/utils.h>
#include <coderun/source.h>
#include <coderun/command.h>
#include <coderun/workspace.h>
#include <coderun/classifier.h>

size_t kMaxCodeLength = 5000;
size_t kMaxInputLength = 1000;

namespace {

const char kMissingFields[] = "Code and language are required.";
const char kTooLarge[] = "Code or input is too large. Please limit their sizes.";
const char kUnsupportedLanguage[] = "Unsupported language.";
const char kMissingJavaClass[] = "Invalid Java code. Class name is missing.";
const char kInvalidJson[] = "Invalid JSON body.";
const char kInvalidInput[] = "Input should be an array of strings.";

std::string InputLine(const nlohmann::json& item) {
  if (item.is_string()) return item.get<std::string>();
  if (item.is_null()) return "";
  return item.dump();
}

bool NonEmptyString(const nlohmann::json& obj, const char* key) {
  auto it = obj.find(key);
  return it != obj.end() && it->is_string() && !it->get_ref<const std::string&>().empty();
}

} // namespace

Pipeline::Pipeline(std::shared_ptr<spdlog::logger> logger) :
    Pipeline(logger, [logger](const Command& cmd, const ExecutionLimits& limits) {
      return Execute(cmd, limits, *logger);
    }) {}

Pipeline::Pipeline(std::shared_ptr<spdlog::logger> logger, Executor executor,
                   const fs::path& workspace_root, const ExecutionLimits& limits) :
    logger_(std::move(logger)),
    executor_(std::move(executor)),
    workspace_root_(workspace_root),
    limits_(limits) {}

std::optional<Response> Pipeline::ParseRequest(const std::string& body, ExecutionRequest& req) {
  using nlohmann::json;
  json data;
  try {
    data = json::parse(body);
  } catch (json::exception&) {
    return InvalidRequest(kInvalidJson);
  }
  if (!data.is_object() || !NonEmptyString(data, "code") || !NonEmptyString(data, "language")) {
    return InvalidRequest(kMissingFields);
  }
  req.code = data["code"].get<std::string>();
  req.language = data["language"].get<std::string>();
  req.input.clear();
  if (auto input = data.find("input"); input != data.end() && !input->is_null()) {
    if (!input->is_array()) return InvalidRequest(kInvalidInput);
    for (auto& item : *input) req.input.push_back(InputLine(item));
  }
  return std::nullopt;
}

Response Pipeline::Run(const std::string& body) const {
  ExecutionRequest req;
  if (auto rejection = ParseRequest(body, req)) {
    logger_->info("Rejected request body: {}", rejection->output);
    return *rejection;
  }
  return Run(req);
}

Response Pipeline::Run(const ExecutionRequest& req) const {
  if (req.code.empty() || req.language.empty()) return InvalidRequest(kMissingFields);
  if (Utf8Length(req.code) > kMaxCodeLength || Utf8Length(JoinInput(req.input)) > kMaxInputLength) {
    logger_->info("Rejected oversized request: code={} input lines={}", req.code.size(), req.input.size());
    return InvalidRequest(kTooLarge, false);
  }
  auto lang = GetLanguage(req.language);
  if (!lang) {
    logger_->info("Rejected unsupported language {}", req.language);
    return InvalidRequest(kUnsupportedLanguage);
  }
  auto file_name = SourceFileName(*lang, req.code);
  if (!file_name) return {Verdict::INVALID_JAVA_CLASS, kMissingJavaClass, ""};

  Workspace workspace(logger_, workspace_root_);
  if (!workspace.Valid()) return MakeResponse(Verdict::INTERNAL_ERROR);
  Response ret = MakeResponse(Verdict::INTERNAL_ERROR);
  try {
    if (auto files = MaterializeSource(workspace, *file_name, req.code, req.input, *logger_)) {
      Command cmd = SynthesizeCommand(*lang, files->source, files->input);
      ExecutionResult result = executor_(cmd, limits_);
      ret = ClassifyExecution(result, limits_);
      if (ret.verdict == Verdict::SUCCESS) {
        logger_->info("Workspace {}: {} executed successfully", workspace.Token(), LanguageName(*lang));
      } else {
        logger_->info("Workspace {}: {} {}, stderr: {}", workspace.Token(), LanguageName(*lang),
                      VerdictName(ret.verdict), result.stderr_data);
      }
    } else {
      logger_->error("Workspace {}: failed to write source files", workspace.Token());
    }
  } catch (const std::exception& e) {
    logger_->error("Workspace {}: internal error: {}", workspace.Token(), e.what());
    ret = MakeResponse(Verdict::INTERNAL_ERROR);
  }
  workspace.Destroy();
  return ret;
}
