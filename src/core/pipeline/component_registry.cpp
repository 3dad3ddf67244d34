// File: src/core/pipeline/component_registry.cpp
#include "ts/core/pipeline/component_registry.hpp"

#include <exception>
#include <utility>

namespace ts {
namespace {

template <typename Factory>
Status add_factory(std::map<std::string, Factory>& factories,
                   const char* what,
                   const std::string& class_name,
                   Factory factory) {
  if (class_name.empty()) return Status::invalid_argument(std::string(what) + " class name is empty");
  if (!factory) return Status::invalid_argument(std::string(what) + " factory for " + class_name + " is empty");
  if (!factories.emplace(class_name, std::move(factory)).second) {
    return Status::invalid_argument(std::string(what) + " class registered twice: " + class_name);
  }
  return Status::ok_status();
}

template <typename T, typename Factory>
Result<T> make_from(const std::map<std::string, Factory>& factories,
                    const char* what,
                    const ClassSpec& spec,
                    const FileFinder& finder) {
  const auto it = factories.find(spec.class_name);
  if (it == factories.end()) {
    return Result<T>::err(Status::not_found(std::string("unknown ") + what + " class: " + spec.class_name));
  }

  try {
    auto made = it->second(spec.args, finder);
    if (!made.ok()) {
      return Result<T>::err_from(made, spec.class_name);
    }
    if (!*made) return Result<T>::err(Status::internal(spec.class_name + ": factory returned null"));
    return made;
  } catch (const std::exception& e) {
    return Result<T>::err(Status::invalid_argument(spec.class_name + ": " + e.what()));
  }
}

template <typename Factory>
std::vector<std::string> names_of(const std::map<std::string, Factory>& factories) {
  std::vector<std::string> names;
  names.reserve(factories.size());
  for (const auto& [name, factory] : factories) names.push_back(name);
  return names;
}

}  // namespace

Status ComponentRegistry::register_reader(const std::string& class_name, ReaderFactory factory) {
  return add_factory(readers_, "reader", class_name, std::move(factory));
}

Status ComponentRegistry::register_transformer(const std::string& class_name, TransformerFactory factory) {
  return add_factory(transformers_, "transformer", class_name, std::move(factory));
}

Status ComponentRegistry::register_enhancer(const std::string& class_name, EnhancerFactory factory) {
  return add_factory(enhancers_, "enhancer", class_name, std::move(factory));
}

Result<std::shared_ptr<Reader>> ComponentRegistry::make_reader(const ClassSpec& spec, const FileFinder& finder) const {
  return make_from<std::shared_ptr<Reader>>(readers_, "reader", spec, finder);
}

Result<std::shared_ptr<const Transformer>> ComponentRegistry::make_transformer(const ClassSpec& spec,
                                                                               const FileFinder& finder) const {
  return make_from<std::shared_ptr<const Transformer>>(transformers_, "transformer", spec, finder);
}

Result<std::shared_ptr<TrialEnhancer>> ComponentRegistry::make_enhancer(const ClassSpec& spec,
                                                                         const FileFinder& finder) const {
  return make_from<std::shared_ptr<TrialEnhancer>>(enhancers_, "enhancer", spec, finder);
}

std::vector<std::string> ComponentRegistry::reader_names() const { return names_of(readers_); }
std::vector<std::string> ComponentRegistry::transformer_names() const { return names_of(transformers_); }
std::vector<std::string> ComponentRegistry::enhancer_names() const { return names_of(enhancers_); }

}  // namespace ts
