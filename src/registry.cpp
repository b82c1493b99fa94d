#include <intent/registry.h>

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace intent {
namespace {

void MergeList(KeywordList &target, const std::vector<std::string> &values,
               bool replace) {
  if (replace) {
    target.clear();
  }
  for (const auto &value : values) {
    if (value.empty()) {
      throw std::invalid_argument("Registry entries cannot be empty");
    }
    if (std::find(target.begin(), target.end(), value) == target.end()) {
      target.push_back(value);
    }
  }
}

void MergeLabels(LabelTable &target, const std::vector<std::string> &values,
                 bool replace) {
  if (replace) {
    target.clear();
  }
  for (const auto &value : values) {
    const auto separator = value.find('=');
    if (separator == std::string::npos || separator == 0 ||
        separator + 1 == value.size()) {
      throw std::invalid_argument("Registry entry '" + value +
                                  "' must have the form needle=label");
    }
    auto needle = value.substr(0, separator);
    auto label = value.substr(separator + 1);
    const auto existing =
        std::find_if(target.begin(), target.end(),
                     [&](const auto &entry) { return entry.first == needle; });
    if (existing != target.end()) {
      existing->second = std::move(label);
    } else {
      target.emplace_back(std::move(needle), std::move(label));
    }
  }
}

KeywordList *ListFor(AnalysisRegistry &registry, const std::string &key) {
  if (key == "sensitive_keywords") {
    return &registry.sensitive_keywords;
  }
  if (key == "critical_keywords") {
    return &registry.critical_keywords;
  }
  if (key == "private_keywords") {
    return &registry.private_keywords;
  }
  if (key == "database_write_methods") {
    return &registry.database_write_methods;
  }
  if (key == "database_purpose_methods") {
    return &registry.database_purpose_methods;
  }
  if (key == "network_identifiers") {
    return &registry.network_identifiers;
  }
  if (key == "filesystem_modules") {
    return &registry.filesystem_modules;
  }
  if (key == "builtin_receivers") {
    return &registry.builtin_receivers;
  }
  if (key == "builtin_modules") {
    return &registry.builtin_modules;
  }
  if (key == "critical_dependency_keywords") {
    return &registry.critical_dependency_keywords;
  }
  return nullptr;
}

} // namespace

AnalysisRegistry MakeDefaultAnalysisRegistry() {
  AnalysisRegistry registry;
  registry.api_decorators = {"Get", "Post", "Put", "Delete", "Controller"};
  registry.database_purpose_methods = {"find",   "save",  "update",
                                       "delete", "query", "insert"};
  registry.auth_functions = {"authenticate", "authorize", "login", "logout",
                             "verifyToken"};
  registry.validation_keywords = {"validate", "check", "verify", "assert"};
  registry.event_handler_prefixes = {"handle", "on"};
  registry.class_purposes = {{"Controller", "Controller"},
                             {"Service", "Service layer"},
                             {"Repository", "Data access"},
                             {"Model", "Data model"}};
  registry.file_name_purposes = {{"controller", "Controller"},
                                 {"service", "Service layer"},
                                 {"util", "Utility function"},
                                 {"test", "Test suite"}};

  registry.critical_keywords = {"payment", "transfer", "balance"};
  registry.sensitive_keywords = {"password", "token", "secret",
                                 "key",      "ssn",   "credit"};
  registry.private_keywords = {"email", "phone"};

  registry.database_write_methods = {"save", "update", "insert", "delete",
                                     "create"};
  registry.filesystem_modules = {"fs", "fsPromises", "fse"};
  registry.network_identifiers = {"fetch", "axios", "request", "http"};
  registry.console_methods = {"log", "error", "warn"};
  registry.global_objects = {"window", "global", "process"};

  registry.builtin_modules = {
      "assert", "buffer",      "child_process", "cluster", "crypto",
      "dns",    "events",      "fs",            "http",    "https",
      "net",    "os",          "path",          "querystring",
      "readline", "stream",    "tls",           "url",     "util",
      "worker_threads",        "zlib"};
  registry.dependency_purposes = {{"express", "Web framework"},
                                  {"react", "UI library"},
                                  {"mongoose", "Database ORM"},
                                  {"axios", "HTTP client"},
                                  {"lodash", "Utility functions"},
                                  {"jsonwebtoken", "Authentication"},
                                  {"bcrypt", "Password hashing"}};
  registry.critical_dependency_keywords = {"auth", "security", "payment",
                                           "database"};

  registry.builtin_receivers = {"console", "Math",  "JSON",
                                "Object",  "Array", "Promise"};
  registry.ordinary_numbers = {0, 1, -1, 10, 100};
  registry.singleton_pattern =
      R"(getInstance|instance\s*=\s*new|private\s+constructor)";
  registry.factory_name_pattern = R"(create[A-Z]\w*|factory|make[A-Z]\w*)";
  registry.observer_pattern =
      R"(addEventListener|on[A-Z]\w*|emit|subscribe|notify)";
  registry.functions_related = [](const ast::Node &) { return true; };
  return registry;
}

std::shared_ptr<const AnalysisRegistry> DefaultAnalysisRegistry() {
  static const std::shared_ptr<const AnalysisRegistry> registry =
      std::make_shared<const AnalysisRegistry>(MakeDefaultAnalysisRegistry());
  return registry;
}

const std::vector<std::string> &SupportedRegistryKeys() {
  static const std::vector<std::string> keys = {
      "sensitive_keywords",     "critical_keywords",
      "private_keywords",       "database_write_methods",
      "database_purpose_methods", "network_identifiers",
      "filesystem_modules",     "builtin_receivers",
      "builtin_modules",        "critical_dependency_keywords",
      "dependency_purposes"};
  return keys;
}

AnalysisRegistry ApplyRegistryOverrides(AnalysisRegistry registry,
                                        const RegistryOverrides &overrides) {
  for (const auto &[key, values] : overrides.tables) {
    if (key == "dependency_purposes") {
      MergeLabels(registry.dependency_purposes, values, overrides.replace);
      continue;
    }
    auto *list = ListFor(registry, key);
    if (list == nullptr) {
      throw std::invalid_argument("Unknown registry table: " + key);
    }
    MergeList(*list, values, overrides.replace);
  }
  return registry;
}

} // namespace intent
