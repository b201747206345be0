#include "catalog_service.hpp"

#include "internal/observability/logging.hpp"
#include "internal/pipeline/template_registry.hpp"
#include "observe_rpc.hpp"

namespace stageflow::service {

using namespace stageflow::service::v1;
using stageflow::observability::StringField;

CatalogService::CatalogService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

RegisterTemplateResponse CatalogService::RegisterTemplate(const RegisterTemplateRequest& req) {
  return ObserveRpc("CatalogService.RegisterTemplate", "", [&] {
    const auto compiled = ctx_.templates->Register(req.pipeline());

    STAGEFLOW_LOG_INFO("Template registered", {StringField("template_id", compiled->definition.id()),
                                               StringField("version", compiled->definition.version()),
                                               StringField("digest", compiled->digest)});

    RegisterTemplateResponse resp;
    resp.set_template_id(compiled->definition.id());
    resp.set_version(compiled->definition.version());
    resp.set_digest(compiled->digest);
    return resp;
  });
}

stageflow::core::v1::PipelineTemplate CatalogService::GetTemplate(const GetTemplateRequest& req) {
  return ObserveRpc("CatalogService.GetTemplate", "", [&] {
    const auto compiled = req.version().empty() ? ctx_.templates->Latest(req.template_id())
                                                : ctx_.templates->Get(req.template_id(), req.version());
    return compiled->definition;
  });
}

ListTemplatesResponse CatalogService::ListTemplates(const ListTemplatesRequest&) {
  return ObserveRpc("CatalogService.ListTemplates", "", [&] {
    ListTemplatesResponse resp;
    for (const auto& [id, version] : ctx_.templates->List()) {
      auto* ref = resp.add_templates();
      ref->set_template_id(id);
      ref->set_version(version);
    }
    return resp;
  });
}

} // namespace stageflow::service
