#pragma once

#include <memory>

namespace fetchbox::broker {
class TaskBroker;
}
namespace fetchbox::queue {
class DurableQueue;
}
namespace fetchbox::deadletter {
class DeadLetterStore;
}

namespace fetchbox::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<fetchbox::broker::TaskBroker>          broker;
  std::shared_ptr<fetchbox::queue::DurableQueue>         queue;
  std::shared_ptr<fetchbox::deadletter::DeadLetterStore> dead_letters;
};

} // namespace fetchbox::service
