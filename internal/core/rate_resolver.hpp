#pragma once

#include <memory>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/util/decimal.hpp"

namespace piecework::core {

/*
  Effective pay rate for (worker, task type).

  A worker override wins over the task type default. An unknown task type
  resolves to zero. Reads happen inside the caller's transaction.
*/
class RateResolver {
 public:
  explicit RateResolver(std::shared_ptr<db::Repository> repository);

  util::Decimal Resolve(db::Transaction& tx, const std::string& worker_id, const std::string& task_type_id) const;

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace piecework::core
