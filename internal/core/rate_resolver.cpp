#include "internal/core/rate_resolver.hpp"

namespace piecework::core {

RateResolver::RateResolver(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

util::Decimal RateResolver::Resolve(db::Transaction& tx, const std::string& worker_id, const std::string& task_type_id) const {
  if (auto override_rate = repository_->GetWorkerRate(tx, worker_id, task_type_id)) {
    return override_rate->rate;
  }
  if (auto task_type = repository_->GetTaskType(tx, task_type_id)) {
    return task_type->default_rate;
  }
  return util::Decimal{};
}

} // namespace piecework::core
