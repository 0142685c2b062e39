#include "minipg/common/errors.hpp"

namespace minipg {

namespace {

class EngineErrorCategory final : public std::error_category {
public:
    const char* name() const noexcept override
    {
        return "minipg.engine";
    }

    std::string message(int condition) const override
    {
        switch (static_cast<EngineErrc>(condition)) {
        case EngineErrc::Success:
            return "success";
        case EngineErrc::UnsupportedStatement:
            return "unsupported statement";
        case EngineErrc::TableNotFound:
            return "table not found";
        case EngineErrc::ColumnNotFound:
            return "column not found";
        case EngineErrc::TableAlreadyExists:
            return "table already exists";
        case EngineErrc::SequenceNotFound:
            return "sequence not found";
        case EngineErrc::AggregateRequiresGroupBy:
            return "aggregate requires group by";
        case EngineErrc::AppendOnlyViolation:
            return "table is not append-only";
        case EngineErrc::MalformedCreateTable:
            return "malformed create table statement";
        case EngineErrc::MalformedPredicate:
            return "malformed predicate";
        case EngineErrc::MalformedInsert:
            return "malformed insert statement";
        case EngineErrc::PerTableStatsFailure:
            return "table statistics refresh failed";
        case EngineErrc::StatsNotFound:
            return "table statistics not found";
        case EngineErrc::StorageFailure:
            return "storage failure";
        default:
            return "unknown engine error";
        }
    }
};

const EngineErrorCategory kCategory{};

}  // namespace

const std::error_category& engine_error_category() noexcept
{
    return kCategory;
}

std::error_code make_error_code(EngineErrc value) noexcept
{
    return {static_cast<int>(value), engine_error_category()};
}

PlanError::PlanError(EngineErrc code, const std::string& what)
    : std::system_error{make_error_code(code), what}
{
}

void throw_engine_error(EngineErrc code, const std::string& what)
{
    throw std::system_error{make_error_code(code), what};
}

std::string error_message(const std::system_error& error)
{
    std::string text = error.what();
    const auto suffix = ": " + error.code().message();
    if (text.size() > suffix.size() && text.ends_with(suffix)) {
        text.erase(text.size() - suffix.size());
    }
    return text;
}

}  // namespace minipg
