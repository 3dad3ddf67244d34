// File: include/ts/core/pipeline/component_registry.hpp
#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "ts/core/config.hpp"
#include "ts/core/io/reader.hpp"
#include "ts/core/io/transformer.hpp"
#include "ts/core/status.hpp"
#include "ts/core/trials/trial_enhancer.hpp"
#include "ts/core/util/file_finder.hpp"
#include "ts/core/value.hpp"

namespace ts {

// Factories get the "args" map from config and a FileFinder for any files they name.
using ReaderFactory = std::function<Result<std::shared_ptr<Reader>>(const ValueMap&, const FileFinder&)>;
using TransformerFactory =
    std::function<Result<std::shared_ptr<const Transformer>>(const ValueMap&, const FileFinder&)>;
using EnhancerFactory = std::function<Result<std::shared_ptr<TrialEnhancer>>(const ValueMap&, const FileFinder&)>;

// Maps config "class" names to factories.
class ComponentRegistry {
 public:
  // Registering a name twice is invalid_argument.
  Status register_reader(const std::string& class_name, ReaderFactory factory);
  Status register_transformer(const std::string& class_name, TransformerFactory factory);
  Status register_enhancer(const std::string& class_name, EnhancerFactory factory);

  // Unknown class names are not_found. Exceptions thrown by a factory come
  // back as invalid_argument naming the class.
  Result<std::shared_ptr<Reader>> make_reader(const ClassSpec& spec, const FileFinder& finder) const;
  Result<std::shared_ptr<const Transformer>> make_transformer(const ClassSpec& spec, const FileFinder& finder) const;
  Result<std::shared_ptr<TrialEnhancer>> make_enhancer(const ClassSpec& spec, const FileFinder& finder) const;

  [[nodiscard]] std::vector<std::string> reader_names() const;
  [[nodiscard]] std::vector<std::string> transformer_names() const;
  [[nodiscard]] std::vector<std::string> enhancer_names() const;

 private:
  std::map<std::string, ReaderFactory> readers_;
  std::map<std::string, TransformerFactory> transformers_;
  std::map<std::string, EnhancerFactory> enhancers_;
};

}  // namespace ts
