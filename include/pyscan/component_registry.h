#pragma once

#include <pyscan/interfaces.h>

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace pyscan {

// Named factories for the pluggable edges of the CLI: reporters and source
// providers. The first registration of a kind becomes its default.
class ComponentRegistry {
public:
  using ReporterFactory = std::function<std::unique_ptr<Reporter>()>;
  using SourceProviderFactory =
      std::function<std::unique_ptr<SourceProvider>()>;

  void RegisterReporter(const std::string &name, ReporterFactory factory,
                        bool set_as_default = false);
  void RegisterSourceProvider(const std::string &name,
                              SourceProviderFactory factory,
                              bool set_as_default = false);

  std::unique_ptr<Reporter> CreateReporter(const std::string &name = "") const;
  std::unique_ptr<SourceProvider>
  CreateSourceProvider(const std::string &name = "") const;

  std::vector<std::string> ReporterNames() const;
  std::vector<std::string> SourceProviderNames() const;

  const std::string &DefaultReporterName() const;
  const std::string &DefaultSourceProviderName() const;

  template <typename Factory>
  struct ComponentSet {
    std::unordered_map<std::string, Factory> factories;
    std::string default_name;
  };

private:
  template <typename Factory>
  static std::vector<std::string>
  RegisteredNames(const ComponentSet<Factory> &set);

  template <typename Factory>
  static std::string JoinNames(const ComponentSet<Factory> &set);

  template <typename Interface, typename Factory>
  std::unique_ptr<Interface>
  CreateComponent(const std::string &name, const ComponentSet<Factory> &set,
                  const std::string &kind) const;

  template <typename Factory>
  void RegisterComponent(const std::string &name, Factory factory,
                         bool set_as_default, ComponentSet<Factory> &set);

  ComponentSet<ReporterFactory> reporters_;
  ComponentSet<SourceProviderFactory> source_providers_;
};

// "markdown" (default, also renders json) and "text" reporters; the
// "filesystem" source provider.
ComponentRegistry MakeComponentRegistryWithDefaults();
const ComponentRegistry &GlobalComponentRegistry();

} // namespace pyscan
