#pragma once

#include "service_context.hpp"
#include "stageflow/core/v1/pipeline.pb.h"
#include "stageflow/service/v1/control.pb.h"

namespace stageflow::service {

// Pipeline template catalog.
class CatalogService {
public:
  explicit CatalogService(ServiceContext ctx);

  stageflow::service::v1::RegisterTemplateResponse
  RegisterTemplate(const stageflow::service::v1::RegisterTemplateRequest& req);

  stageflow::core::v1::PipelineTemplate
  GetTemplate(const stageflow::service::v1::GetTemplateRequest& req);

  stageflow::service::v1::ListTemplatesResponse
  ListTemplates(const stageflow::service::v1::ListTemplatesRequest& req);

private:
  ServiceContext ctx_;
};

}
