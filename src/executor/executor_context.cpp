#include "minipg/executor/executor_context.hpp"

#include <stdexcept>
#include <utility>

namespace minipg::executor {

ExecutorContext::ExecutorContext(ExecutorContextConfig config)
    : config_{std::move(config)}
{
}

const catalog::CatalogStore* ExecutorContext::catalog() const noexcept
{
    return config_.catalog;
}

storage::TableStore& ExecutorContext::tables() const
{
    if (config_.tables == nullptr) {
        throw std::logic_error{"executor context has no table store"};
    }
    return *config_.tables;
}

DiagnosticLog* ExecutorContext::diagnostics() const noexcept
{
    return config_.diagnostics;
}

}  // namespace minipg::executor
