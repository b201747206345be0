#include "internal/pipeline/template_registry.hpp"

#include <google/protobuf/io/coded_stream.h>
#include <google/protobuf/io/zero_copy_stream_impl_lite.h>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/sha256.hpp"
#include "internal/util/time.hpp"

namespace stageflow::pipeline {

using stageflow::core::v1::PipelineTemplate;
using stageflow::observability::StringField;

namespace {

std::string SerializeDeterministic(const PipelineTemplate& definition) {
  std::string out;
  {
    google::protobuf::io::StringOutputStream raw(&out);
    google::protobuf::io::CodedOutputStream  coded(&raw);
    coded.SetSerializationDeterministic(true);
    definition.SerializeToCodedStream(&coded);
  }
  return out;
}

std::string KeyText(const std::string& id, const std::string& version) {
  return id + "@" + version;
}

} // namespace

TemplateRegistry::TemplateRegistry(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

std::string TemplateRegistry::Digest(const PipelineTemplate& definition) {
  return util::Sha256Hex(SerializeDeterministic(definition));
}

std::shared_ptr<const CompiledTemplate> TemplateRegistry::Compile(const PipelineTemplate& definition) const {
  auto compiled        = std::make_shared<CompiledTemplate>();
  compiled->definition = definition;
  compiled->graph      = resolver::DependencyGraph::Build(definition);
  compiled->digest     = Digest(definition);
  return compiled;
}

std::shared_ptr<const CompiledTemplate> TemplateRegistry::Register(const PipelineTemplate& definition) {
  if (definition.id().empty()) throw util::ValidationError("template id is required");
  if (definition.version().empty()) throw util::ValidationError("template version is required");

  auto compiled = Compile(definition);
  Key  key{definition.id(), definition.version()};

  std::lock_guard lock(mutex_);

  auto tx       = repository_->Begin();
  auto existing = repository_->GetTemplate(*tx, key.first, key.second);
  if (existing) {
    tx->Rollback();
    if (existing->content_digest != compiled->digest) {
      throw util::AlreadyExists("template " + KeyText(key.first, key.second) + " is already registered with different content");
    }
    auto it = compiled_.find(key);
    if (it != compiled_.end()) return it->second;
    compiled_[key] = compiled;
    return compiled;
  }

  db::model::TemplateRecord record;
  record.template_id    = key.first;
  record.version        = key.second;
  record.payload        = SerializeDeterministic(definition);
  record.content_digest = compiled->digest;
  record.created_at_ms  = util::ToUnixMillis(util::Now());

  db::ThrowIfError(repository_->InsertTemplate(*tx, record), "register template " + KeyText(key.first, key.second));
  tx->Commit();

  compiled_[key] = compiled;

  STAGEFLOW_LOG_INFO("Template registered", {StringField("template_id", key.first), StringField("version", key.second),
                                             StringField("digest", compiled->digest.substr(0, 12))});
  return compiled;
}

std::shared_ptr<const CompiledTemplate> TemplateRegistry::Get(const std::string& template_id, const std::string& version) {
  Key key{template_id, version};

  std::lock_guard lock(mutex_);
  auto            it = compiled_.find(key);
  if (it != compiled_.end()) return it->second;

  auto tx     = repository_->Begin();
  auto record = repository_->GetTemplate(*tx, template_id, version);
  tx->Commit();
  if (!record) throw util::NotFound("template " + KeyText(template_id, version));

  PipelineTemplate definition;
  if (!definition.ParseFromString(record->payload)) {
    throw std::runtime_error("stored template " + KeyText(template_id, version) + " is corrupt");
  }

  auto compiled  = Compile(definition);
  compiled_[key] = compiled;
  return compiled;
}

std::shared_ptr<const CompiledTemplate> TemplateRegistry::Latest(const std::string& template_id) {
  std::string version;
  uint64_t    newest = 0;
  {
    std::lock_guard lock(mutex_);
    auto            tx = repository_->Begin();
    for (const auto& record : repository_->ListTemplates(*tx)) {
      if (record.template_id != template_id) continue;
      if (version.empty() || record.created_at_ms >= newest) {
        version = record.version;
        newest  = record.created_at_ms;
      }
    }
    tx->Commit();
  }
  if (version.empty()) throw util::NotFound("template " + template_id);
  return Get(template_id, version);
}

std::vector<std::pair<std::string, std::string>> TemplateRegistry::List() {
  std::lock_guard                                  lock(mutex_);
  std::vector<std::pair<std::string, std::string>> out;
  auto                                             tx = repository_->Begin();
  for (const auto& record : repository_->ListTemplates(*tx)) out.emplace_back(record.template_id, record.version);
  tx->Commit();
  return out;
}

} // namespace stageflow::pipeline
