#include "cronspan/cron/expression.hpp"
#include "cronspan/core/utils.hpp"

namespace cronspan::cron {

auto CronExpression::parse(std::string_view expr) -> Result<CronExpression> {
    auto tokens = utils::split_whitespace(expr);

    if (tokens.size() != 5) {
        return std::unexpected(make_error(
            ErrorCode::MalformedField,
            "Cron expression must have exactly 5 fields",
            "got " + std::to_string(tokens.size()) + " in '" +
                std::string(expr) + "'"));
    }

    CronExpression parsed;
    parsed.raw_ = std::string(expr);

    for (auto kind : kAllFields) {
        auto i = index(kind);
        auto subentries = parse_field(tokens[i], kind);
        if (!subentries) {
            const auto& err = subentries.error();
            return std::unexpected(make_error(
                err.code(), std::string(err.message()),
                std::string(err.detail()) + " in '" + std::string(expr) + "'"));
        }

        parsed.values_[i] = expand_field(*subentries, kind);
        parsed.subentries_[i] = std::move(*subentries);
        parsed.fields_[i] = std::move(tokens[i]);
    }

    return parsed;
}

auto parse_cron(std::string_view expr) -> Result<CronExpression> {
    return CronExpression::parse(expr);
}

} // namespace cronspan::cron
