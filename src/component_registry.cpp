#include <pyscan/component_registry.h>

#include <pyscan/file_source_provider.h>
#include <pyscan/markdown_reporter.h>
#include <pyscan/text_reporter.h>

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace {

constexpr const char kMarkdownReporter[] = "markdown";
constexpr const char kTextReporter[] = "text";
constexpr const char kFileSourceProvider[] = "filesystem";

} // namespace

namespace pyscan {

template <typename Factory>
std::vector<std::string>
ComponentRegistry::RegisteredNames(const ComponentSet<Factory> &set) {
  std::vector<std::string> names;
  names.reserve(set.factories.size());
  for (const auto &entry : set.factories) {
    names.push_back(entry.first);
  }
  std::sort(names.begin(), names.end());
  return names;
}

template <typename Factory>
std::string ComponentRegistry::JoinNames(const ComponentSet<Factory> &set) {
  const auto names = RegisteredNames(set);
  std::string message;
  for (std::size_t i = 0; i < names.size(); ++i) {
    message += names[i];
    if (i + 1 < names.size()) {
      message += ", ";
    }
  }
  return message;
}

template <typename Interface, typename Factory>
std::unique_ptr<Interface>
ComponentRegistry::CreateComponent(const std::string &name,
                                   const ComponentSet<Factory> &set,
                                   const std::string &kind) const {
  const auto target_name = name.empty() ? set.default_name : name;
  if (target_name.empty()) {
    throw std::invalid_argument("No default " + kind + " registered");
  }
  const auto found = set.factories.find(target_name);
  if (found == set.factories.end()) {
    throw std::invalid_argument("Unknown " + kind + " '" + target_name +
                                "'. Registered: " + JoinNames(set));
  }
  auto instance = found->second();
  if (!instance) {
    throw std::runtime_error("Factory for " + kind + " '" + target_name +
                             "' returned null");
  }
  return instance;
}

template <typename Factory>
void ComponentRegistry::RegisterComponent(const std::string &name,
                                          Factory factory,
                                          bool set_as_default,
                                          ComponentSet<Factory> &set) {
  if (name.empty()) {
    throw std::invalid_argument("Component name cannot be empty");
  }
  if (!factory) {
    throw std::invalid_argument("Factory for '" + name + "' cannot be null");
  }
  if (set.factories.count(name) != 0) {
    throw std::invalid_argument("Component with name '" + name +
                                "' already registered");
  }
  set.factories.emplace(name, std::move(factory));
  if (set_as_default || set.default_name.empty()) {
    set.default_name = name;
  }
}

void ComponentRegistry::RegisterReporter(const std::string &name,
                                         ReporterFactory factory,
                                         bool set_as_default) {
  RegisterComponent(name, std::move(factory), set_as_default, reporters_);
}

void ComponentRegistry::RegisterSourceProvider(const std::string &name,
                                               SourceProviderFactory factory,
                                               bool set_as_default) {
  RegisterComponent(name, std::move(factory), set_as_default,
                    source_providers_);
}

std::unique_ptr<Reporter>
ComponentRegistry::CreateReporter(const std::string &name) const {
  return CreateComponent<Reporter>(name, reporters_, "reporter");
}

std::unique_ptr<SourceProvider>
ComponentRegistry::CreateSourceProvider(const std::string &name) const {
  return CreateComponent<SourceProvider>(name, source_providers_,
                                         "source provider");
}

std::vector<std::string> ComponentRegistry::ReporterNames() const {
  return RegisteredNames(reporters_);
}

std::vector<std::string> ComponentRegistry::SourceProviderNames() const {
  return RegisteredNames(source_providers_);
}

const std::string &ComponentRegistry::DefaultReporterName() const {
  return reporters_.default_name;
}

const std::string &ComponentRegistry::DefaultSourceProviderName() const {
  return source_providers_.default_name;
}

ComponentRegistry MakeComponentRegistryWithDefaults() {
  ComponentRegistry registry;
  registry.RegisterReporter(
      kMarkdownReporter, []() { return std::make_unique<MarkdownReporter>(); },
      true);
  registry.RegisterReporter(kTextReporter,
                            []() { return std::make_unique<TextReporter>(); });
  registry.RegisterSourceProvider(kFileSourceProvider, []() {
    return std::make_unique<FileSourceProvider>();
  }, true);
  return registry;
}

const ComponentRegistry &GlobalComponentRegistry() {
  static const ComponentRegistry registry = MakeComponentRegistryWithDefaults();
  return registry;
}

} // namespace pyscan
