#pragma once

#include <memory>

namespace fleet::auth { class KeyRegistry; }
namespace fleet::ingest { class MessageIngestor; }
namespace fleet::scheduler { class JobScheduler; }
namespace fleet::dispatch { class CommandDispatcher; }
namespace fleet::links { class DownloadLinkIssuer; }

namespace fleet::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<fleet::auth::KeyRegistry> keys;
  std::shared_ptr<fleet::ingest::MessageIngestor> ingestor;
  std::shared_ptr<fleet::scheduler::JobScheduler> scheduler;
  std::shared_ptr<fleet::dispatch::CommandDispatcher> dispatcher;
  std::shared_ptr<fleet::links::DownloadLinkIssuer> links;
};

}
