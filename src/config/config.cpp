#include "drover/config/config.hpp"

#include "drover/common/fs.hpp"
#include "drover/common/toml.hpp"

#include <cmath>
#include <cstdlib>
#include <sstream>

namespace drover::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".drover";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::string> env_value(const char *name) {
  if (const char *value = std::getenv(name); value != nullptr && *value != '\0') {
    return std::string(value);
  }
  return std::nullopt;
}

std::string mask_secret(const std::string &secret) {
  if (secret.size() <= 8) {
    return "****";
  }
  return secret.substr(0, 4) + "****" + secret.substr(secret.size() - 4);
}

bool valid_fraction(const double value) { return value > 0.0 && value < 1.0; }

std::string render_array(const std::vector<std::string> &values) {
  std::string out = "[";
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0) {
      out += ", ";
    }
    out += common::quote_toml_string(values[i]);
  }
  return out + "]";
}

void read_provider(const common::TomlDocument &doc, ProviderConfig &provider) {
  provider.base_url = common::expand_path(doc.get_string("provider.base_url", provider.base_url));
  provider.model = doc.get_string("provider.model", provider.model);
  if (doc.has("provider.api_key")) {
    provider.api_key = common::expand_path(doc.get_string("provider.api_key"));
  }
  provider.temperature = doc.get_double("provider.temperature", provider.temperature);
  provider.max_output_tokens = static_cast<std::uint32_t>(
      doc.get_u64("provider.max_output_tokens", provider.max_output_tokens));
  provider.context_window = doc.get_u64("provider.context_window", provider.context_window);
  provider.max_retries =
      static_cast<std::uint32_t>(doc.get_u64("provider.max_retries", provider.max_retries));
  provider.backoff_ms = doc.get_u64("provider.backoff_ms", provider.backoff_ms);
  provider.timeout_ms = doc.get_u64("provider.timeout_ms", provider.timeout_ms);
  provider.embedding_model = doc.get_string("provider.embedding_model", provider.embedding_model);
  provider.embedding_dimensions = static_cast<std::size_t>(
      doc.get_u64("provider.embedding_dimensions", provider.embedding_dimensions));
}

void read_agent(const common::TomlDocument &doc, AgentConfig &agent) {
  agent.max_turns = static_cast<std::uint32_t>(doc.get_u64("agent.max_turns", agent.max_turns));
  agent.timeout_ms = doc.get_u64("agent.timeout_ms", agent.timeout_ms);
  agent.grace_fixed_ms = doc.get_u64("agent.grace_fixed_ms", agent.grace_fixed_ms);
  agent.min_useful_recovery_ms =
      doc.get_u64("agent.min_useful_recovery_ms", agent.min_useful_recovery_ms);
  agent.tool_parallelism =
      static_cast<std::uint32_t>(doc.get_u64("agent.tool_parallelism", agent.tool_parallelism));
  agent.autonomous_tool_parallelism = static_cast<std::uint32_t>(
      doc.get_u64("agent.autonomous_tool_parallelism", agent.autonomous_tool_parallelism));
  agent.time_warning_fraction =
      doc.get_double("agent.time_warning_fraction", agent.time_warning_fraction);
}

void read_context(const common::TomlDocument &doc, ContextConfig &context) {
  context.compression_threshold =
      doc.get_double("context.compression_threshold", context.compression_threshold);
  context.preserve_fraction = doc.get_double("context.preserve_fraction", context.preserve_fraction);
  context.token_budget = doc.get_u64("context.token_budget", context.token_budget);
  context.recency_half_life_ms =
      doc.get_u64("context.recency_half_life_ms", context.recency_half_life_ms);
  context.use_embeddings = doc.get_bool("context.use_embeddings", context.use_embeddings);
  context.embedding_cache_path =
      common::expand_path(doc.get_string("context.embedding_cache_path", context.embedding_cache_path));

  auto &weights = context.scoring_weights;
  weights.bm25 = doc.get_double("context.scoring_weights.bm25", weights.bm25);
  weights.embedding = doc.get_double("context.scoring_weights.embedding", weights.embedding);
  weights.recency = doc.get_double("context.scoring_weights.recency", weights.recency);
  weights.manual = doc.get_double("context.scoring_weights.manual", weights.manual);
}

void read_loop_detection(const common::TomlDocument &doc, LoopDetectionConfig &loop) {
  loop.enabled = doc.get_bool("loop_detection.enabled", loop.enabled);
  loop.max_tool_call_loop = static_cast<std::uint32_t>(
      doc.get_u64("loop_detection.max_tool_call_loop", loop.max_tool_call_loop));
  loop.max_content_loop = static_cast<std::uint32_t>(
      doc.get_u64("loop_detection.max_content_loop", loop.max_content_loop));
  loop.content_chunk_size = static_cast<std::uint32_t>(
      doc.get_u64("loop_detection.content_chunk_size", loop.content_chunk_size));
  loop.max_history_length = static_cast<std::uint32_t>(
      doc.get_u64("loop_detection.max_history_length", loop.max_history_length));
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error());
  }
  return common::Result<std::filesystem::path>::success(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (g_config_path_override.has_value()) {
    return common::Result<std::filesystem::path>::success(
        std::filesystem::path(common::expand_path(g_config_path_override->string())));
  }
  if (auto env = env_value("DROVER_CONFIG_PATH"); env.has_value()) {
    return common::Result<std::filesystem::path>::success(
        std::filesystem::path(common::expand_path(*env)));
  }
  auto dir = config_dir();
  if (!dir.ok()) {
    return common::Result<std::filesystem::path>::failure(dir.error());
  }
  return common::Result<std::filesystem::path>::success(dir.value() / CONFIG_FILENAME);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  g_config_path_override = std::move(path);
}

common::Result<Config> parse_config(const std::string &toml) {
  const auto parsed = common::parse_toml(toml);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.error());
  }
  const auto &doc = parsed.value();

  Config config;
  read_provider(doc, config.provider);
  read_agent(doc, config.agent);
  read_context(doc, config.context);
  read_loop_detection(doc, config.loop_detection);

  config.scheduler.truncate_output_bytes =
      doc.get_u64("scheduler.truncate_output_bytes", config.scheduler.truncate_output_bytes);
  config.scheduler.truncate_output_lines = static_cast<std::uint32_t>(
      doc.get_u64("scheduler.truncate_output_lines", config.scheduler.truncate_output_lines));
  config.scheduler.output_dir =
      common::expand_path(doc.get_string("scheduler.output_dir", config.scheduler.output_dir));

  config.security.approval_mode =
      common::to_lower(doc.get_string("security.approval_mode", config.security.approval_mode));
  config.security.allow = doc.get_string_array("security.allow");
  config.security.deny = doc.get_string_array("security.deny");
  config.security.ask = doc.get_string_array("security.ask");
  config.security.interactive = doc.get_bool("security.interactive", config.security.interactive);

  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);
  config.observability.level = doc.get_string("observability.level", config.observability.level);

  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  const auto path = config_path();
  Config config;
  if (path.ok() && std::filesystem::exists(path.value())) {
    auto content = common::read_text_file(path.value());
    if (!content.ok()) {
      return common::Result<Config>::failure(content.error());
    }
    auto parsed = parse_config(content.value());
    if (!parsed.ok()) {
      return common::Result<Config>::failure(path.value().string() + ": " + parsed.error());
    }
    config = std::move(parsed.value());
  }
  apply_env_overrides(config);
  return common::Result<Config>::success(std::move(config));
}

void apply_env_overrides(Config &config) {
  if (auto key = env_value("DROVER_API_KEY"); key.has_value()) {
    config.provider.api_key = *key;
  } else if (!config.provider.api_key.has_value() ||
             common::trim(*config.provider.api_key).empty()) {
    if (auto fallback = env_value("OPENAI_API_KEY"); fallback.has_value()) {
      config.provider.api_key = *fallback;
    }
  }
  if (auto model = env_value("DROVER_MODEL"); model.has_value()) {
    config.provider.model = *model;
  }
  if (auto base_url = env_value("DROVER_BASE_URL"); base_url.has_value()) {
    config.provider.base_url = *base_url;
  }
  if (auto max_turns = env_value("DROVER_MAX_TURNS"); max_turns.has_value()) {
    char *end = nullptr;
    const unsigned long parsed = std::strtoul(max_turns->c_str(), &end, 10);
    if (end != nullptr && *end == '\0' && parsed > 0) {
      config.agent.max_turns = static_cast<std::uint32_t>(parsed);
    }
  }
  if (auto mode = env_value("DROVER_APPROVAL_MODE"); mode.has_value()) {
    config.security.approval_mode = common::to_lower(*mode);
  }
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  using ValidationResult = common::Result<std::vector<std::string>>;
  std::vector<std::string> warnings;

  if (config.provider.temperature < 0.0 || config.provider.temperature > 2.0) {
    return ValidationResult::failure("provider.temperature must be between 0.0 and 2.0");
  }
  if (!valid_fraction(config.context.compression_threshold)) {
    return ValidationResult::failure("context.compression_threshold must be in (0, 1)");
  }
  if (!valid_fraction(config.context.preserve_fraction)) {
    return ValidationResult::failure("context.preserve_fraction must be in (0, 1)");
  }
  if (!valid_fraction(config.agent.time_warning_fraction)) {
    return ValidationResult::failure("agent.time_warning_fraction must be in (0, 1)");
  }

  const auto &weights = config.context.scoring_weights;
  if (weights.bm25 < 0.0 || weights.embedding < 0.0 || weights.recency < 0.0 ||
      weights.manual < 0.0) {
    return ValidationResult::failure("context.scoring_weights must not be negative");
  }
  const double weight_sum = weights.bm25 + weights.embedding + weights.recency + weights.manual;
  if (weight_sum <= 0.0) {
    return ValidationResult::failure("context.scoring_weights must not all be zero");
  }
  if (std::abs(weight_sum - 1.0) > 0.001) {
    warnings.push_back("context.scoring_weights sum to " + std::to_string(weight_sum) +
                       "; scores will not be in [0, 1]");
  }
  if (weights.embedding > 0.0 && !config.context.use_embeddings) {
    warnings.push_back("context.scoring_weights.embedding is set but context.use_embeddings is off");
  }

  if (config.agent.max_turns == 0) {
    return ValidationResult::failure("agent.max_turns must be at least 1");
  }
  if (config.agent.timeout_ms == 0) {
    return ValidationResult::failure("agent.timeout_ms must be positive");
  }
  if (config.agent.tool_parallelism == 0 || config.agent.autonomous_tool_parallelism == 0) {
    return ValidationResult::failure("tool parallelism must be at least 1");
  }
  if (config.agent.tool_parallelism > 1 && config.security.interactive) {
    warnings.push_back("agent.tool_parallelism > 1 is ignored while confirmations are enabled");
  }
  if (config.agent.min_useful_recovery_ms > config.agent.grace_fixed_ms) {
    warnings.push_back("agent.min_useful_recovery_ms exceeds agent.grace_fixed_ms; recovery turns "
                       "will never run");
  }

  if (config.loop_detection.max_tool_call_loop < 2 || config.loop_detection.max_content_loop < 2) {
    return ValidationResult::failure("loop_detection thresholds must be at least 2");
  }
  if (config.loop_detection.content_chunk_size == 0) {
    return ValidationResult::failure("loop_detection.content_chunk_size must be positive");
  }

  const std::string &mode = config.security.approval_mode;
  if (mode != "default" && mode != "auto_edit" && mode != "yolo") {
    return ValidationResult::failure("Unknown security.approval_mode: " + mode);
  }

  if (!config.provider.api_key.has_value() || common::trim(*config.provider.api_key).empty()) {
    warnings.push_back("No API key configured (set provider.api_key or DROVER_API_KEY)");
  }

  return ValidationResult::success(std::move(warnings));
}

std::string render_config(const Config &config) {
  std::ostringstream out;
  out << "[provider]\n";
  out << "base_url = " << common::quote_toml_string(config.provider.base_url) << "\n";
  out << "model = " << common::quote_toml_string(config.provider.model) << "\n";
  if (config.provider.api_key.has_value()) {
    out << "api_key = " << common::quote_toml_string(mask_secret(*config.provider.api_key))
        << "\n";
  }
  out << "temperature = " << config.provider.temperature << "\n";
  out << "max_output_tokens = " << config.provider.max_output_tokens << "\n";
  out << "context_window = " << config.provider.context_window << "\n";
  out << "max_retries = " << config.provider.max_retries << "\n";
  out << "backoff_ms = " << config.provider.backoff_ms << "\n";
  out << "timeout_ms = " << config.provider.timeout_ms << "\n";
  out << "embedding_model = " << common::quote_toml_string(config.provider.embedding_model)
      << "\n\n";

  out << "[agent]\n";
  out << "max_turns = " << config.agent.max_turns << "\n";
  out << "timeout_ms = " << config.agent.timeout_ms << "\n";
  out << "grace_fixed_ms = " << config.agent.grace_fixed_ms << "\n";
  out << "min_useful_recovery_ms = " << config.agent.min_useful_recovery_ms << "\n";
  out << "tool_parallelism = " << config.agent.tool_parallelism << "\n";
  out << "autonomous_tool_parallelism = " << config.agent.autonomous_tool_parallelism << "\n";
  out << "time_warning_fraction = " << config.agent.time_warning_fraction << "\n\n";

  out << "[context]\n";
  out << "compression_threshold = " << config.context.compression_threshold << "\n";
  out << "preserve_fraction = " << config.context.preserve_fraction << "\n";
  out << "token_budget = " << config.context.token_budget << "\n";
  out << "recency_half_life_ms = " << config.context.recency_half_life_ms << "\n";
  out << "use_embeddings = " << (config.context.use_embeddings ? "true" : "false") << "\n\n";

  out << "[context.scoring_weights]\n";
  out << "bm25 = " << config.context.scoring_weights.bm25 << "\n";
  out << "embedding = " << config.context.scoring_weights.embedding << "\n";
  out << "recency = " << config.context.scoring_weights.recency << "\n";
  out << "manual = " << config.context.scoring_weights.manual << "\n\n";

  out << "[loop_detection]\n";
  out << "enabled = " << (config.loop_detection.enabled ? "true" : "false") << "\n";
  out << "max_tool_call_loop = " << config.loop_detection.max_tool_call_loop << "\n";
  out << "max_content_loop = " << config.loop_detection.max_content_loop << "\n\n";

  out << "[scheduler]\n";
  out << "truncate_output_bytes = " << config.scheduler.truncate_output_bytes << "\n";
  out << "output_dir = " << common::quote_toml_string(config.scheduler.output_dir) << "\n\n";

  out << "[security]\n";
  out << "approval_mode = " << common::quote_toml_string(config.security.approval_mode) << "\n";
  out << "allow = " << render_array(config.security.allow) << "\n";
  out << "deny = " << render_array(config.security.deny) << "\n";
  out << "ask = " << render_array(config.security.ask) << "\n";
  out << "interactive = " << (config.security.interactive ? "true" : "false") << "\n\n";

  out << "[observability]\n";
  out << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";
  out << "level = " << common::quote_toml_string(config.observability.level) << "\n";
  return out.str();
}

} // namespace drover::config
