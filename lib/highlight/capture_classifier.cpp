// semtok/highlight/capture_classifier.cpp - Capture name classification
#include "semtok/highlight/capture_classifier.hpp"

#include "semtok/basic/error.hpp"

namespace semtok
{

namespace
{

std::string join(const std::vector<std::string> & parts, std::string_view sep)
{
  std::string out;
  for (size_t i = 0; i < parts.size(); ++i) {
    if (i > 0) out += sep;
    out += parts[i];
  }
  return out;
}

std::string describe_mapping(std::string_view source, const TypeMappingTarget & target)
{
  std::string msg = std::string(source) + " -> " + target.target_token_type;
  if (!target.target_token_modifiers.empty()) {
    msg += " with modifiers: " + join(target.target_token_modifiers, ", ");
  }
  return msg;
}

}  // namespace

CaptureName parse_capture_name(std::string_view name)
{
  if (name.empty()) {
    throw InvalidCapture("capture name is empty");
  }

  CaptureName out;
  size_t begin = 0;
  bool first = true;
  while (true) {
    const size_t dot = name.find('.', begin);
    const std::string_view segment =
      name.substr(begin, dot == std::string_view::npos ? std::string_view::npos : dot - begin);
    if (first) {
      out.base_type = std::string(segment);
      first = false;
    } else {
      out.modifiers.emplace_back(segment);
    }
    if (dot == std::string_view::npos) break;
    begin = dot + 1;
  }
  return out;
}

std::optional<TokenClass> classify_capture(
  std::string_view capture_name, const TypeMapping * mapping, const TokenLegend & legend,
  const Logger & logger)
{
  CaptureName parsed = parse_capture_name(capture_name);

  TokenClass cls{std::move(parsed.base_type), std::move(parsed.modifiers)};

  if (mapping != nullptr) {
    auto it = mapping->find(std::string(capture_name));
    if (it != mapping->end()) {
      logger.debug([&] { return "applied type mapping for original name: " +
                                describe_mapping(capture_name, it->second); });
    } else {
      it = mapping->find(cls.type);
      if (it != mapping->end()) {
        logger.debug([&] { return "applied type mapping for base type: " +
                                  describe_mapping(cls.type, it->second); });
      }
    }
    if (it != mapping->end()) {
      cls.type = it->second.target_token_type;
      cls.modifiers = it->second.target_token_modifiers;
    }
  }

  if (!legend.has_type(cls.type)) {
    return std::nullopt;
  }

  std::vector<std::string> kept;
  kept.reserve(cls.modifiers.size());
  for (auto & m : cls.modifiers) {
    if (legend.has_modifier(m)) {
      kept.push_back(std::move(m));
    }
  }
  cls.modifiers = std::move(kept);
  return cls;
}

}  // namespace semtok
