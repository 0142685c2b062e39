#pragma once

namespace minipg {
class DiagnosticLog;
}

namespace minipg::catalog {
class CatalogStore;
}

namespace minipg::storage {
class TableStore;
}

namespace minipg::executor {

struct ExecutorContextConfig final {
    const catalog::CatalogStore* catalog = nullptr;
    storage::TableStore* tables = nullptr;
    DiagnosticLog* diagnostics = nullptr;
};

class ExecutorContext final {
public:
    ExecutorContext() = default;
    explicit ExecutorContext(ExecutorContextConfig config);

    [[nodiscard]] const catalog::CatalogStore* catalog() const noexcept;
    // Throws std::logic_error when the context was built without a table store.
    [[nodiscard]] storage::TableStore& tables() const;
    [[nodiscard]] DiagnosticLog* diagnostics() const noexcept;

private:
    ExecutorContextConfig config_{};
};

}  // namespace minipg::executor
