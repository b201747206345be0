#include "internal/pipeline/prompt_template.hpp"

#include <cctype>

#include "internal/util/errors.hpp"

namespace stageflow::pipeline {

namespace {

std::string Trim(std::string_view s) {
  std::size_t begin = 0;
  std::size_t end   = s.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
  while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
  return std::string(s.substr(begin, end - begin));
}

bool IsIdentifier(std::string_view s) {
  if (s.empty()) return false;
  for (char c : s) {
    if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '-') return false;
  }
  return true;
}

std::vector<std::string> SplitPath(const std::string& path) {
  std::vector<std::string> parts;
  std::size_t              start = 0;
  while (true) {
    auto dot = path.find('.', start);
    parts.push_back(path.substr(start, dot == std::string::npos ? std::string::npos : dot - start));
    if (dot == std::string::npos) break;
    start = dot + 1;
  }
  return parts;
}

Placeholder ParsePath(const std::string& path) {
  auto        parts = SplitPath(path);
  Placeholder p;
  p.path = path;

  for (const auto& part : parts) {
    if (!IsIdentifier(part)) {
      throw util::ValidationError("invalid placeholder path '" + path + "'");
    }
  }

  if (parts.size() == 1) {
    p.root = "inputs";
    p.name = parts[0];
    return p;
  }

  if (parts[0] == "inputs" && parts.size() == 2) {
    p.root = "inputs";
    p.name = parts[1];
    return p;
  }

  if (parts[0] == "steps" && (parts.size() == 2 || parts.size() == 3)) {
    p.root  = "steps";
    p.name  = parts[1];
    p.field = parts.size() == 3 ? parts[2] : "output";
    if (p.field != "output" && p.field != "feedback") {
      throw util::ValidationError("unknown stage field '" + p.field + "' in placeholder '" + path + "'");
    }
    return p;
  }

  throw util::ValidationError("invalid placeholder path '" + path + "'");
}

// Calls visit(literal_begin, literal_end, placeholder) for every placeholder.
template <typename Visitor>
void Scan(std::string_view text, Visitor&& visit) {
  std::size_t pos = 0;
  while (pos < text.size()) {
    auto open  = text.find("{{", pos);
    auto close = text.find("}}", pos);

    if (close != std::string_view::npos && (open == std::string_view::npos || close < open)) {
      throw util::ValidationError("unmatched '}}' at offset " + std::to_string(close));
    }
    if (open == std::string_view::npos) {
      visit(text.substr(pos), nullptr);
      return;
    }

    auto end = text.find("}}", open + 2);
    if (end == std::string_view::npos) {
      throw util::ValidationError("unclosed '{{' at offset " + std::to_string(open));
    }

    auto inner = text.substr(open + 2, end - open - 2);
    if (inner.find("{{") != std::string_view::npos) {
      throw util::ValidationError("nested '{{' at offset " + std::to_string(open));
    }

    auto path = Trim(inner);
    if (path.empty()) {
      throw util::ValidationError("empty placeholder at offset " + std::to_string(open));
    }

    auto placeholder = ParsePath(path);
    visit(text.substr(pos, open - pos), &placeholder);
    pos = end + 2;
  }
}

} // namespace

void PromptTemplate::Validate(std::string_view text) {
  if (text.size() > kMaxPromptTemplateLength) {
    throw util::ValidationError("prompt template exceeds " + std::to_string(kMaxPromptTemplateLength) + " characters");
  }
  Scan(text, [](std::string_view, const Placeholder*) {});
}

std::vector<Placeholder> PromptTemplate::Placeholders(std::string_view text) {
  std::vector<Placeholder> out;
  Scan(text, [&](std::string_view, const Placeholder* p) {
    if (p) out.push_back(*p);
  });
  return out;
}

std::string PromptTemplate::Render(std::string_view text, const RenderContext& context) {
  std::string out;
  out.reserve(text.size());

  Scan(text, [&](std::string_view literal, const Placeholder* p) {
    out.append(literal);
    if (!p) return;

    if (p->root == "inputs") {
      auto it = context.inputs.find(p->name);
      if (it == context.inputs.end()) {
        throw util::ValidationError("missing input '" + p->name + "' for placeholder '" + p->path + "'");
      }
      out.append(it->second);
      return;
    }

    const auto& values = p->field == "feedback" ? context.stage_feedback : context.stage_outputs;
    auto        it     = values.find(p->name);
    if (it == values.end()) {
      throw util::ValidationError("no " + p->field + " from stage '" + p->name + "' for placeholder '" + p->path + "'");
    }
    out.append(it->second);
  });

  return out;
}

} // namespace stageflow::pipeline
