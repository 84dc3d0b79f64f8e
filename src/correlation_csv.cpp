#include <esg/correlation_csv.hpp>

#include <spdlog/spdlog.h>

#include <charconv>
#include <cmath>
#include <cstddef>
#include <fstream>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace esg {

namespace {

constexpr std::string_view kBlank = " \t\r\n";

std::string_view strip(std::string_view cell) {
    const auto begin = cell.find_first_not_of(kBlank);
    if (begin == std::string_view::npos) {
        return {};
    }
    return cell.substr(begin, cell.find_last_not_of(kBlank) - begin + 1);
}

// Cells of one record; a trailing comma yields a final empty cell.
std::vector<std::string_view> split_cells(std::string_view line) {
    std::vector<std::string_view> cells;
    std::size_t from = 0;
    for (std::size_t comma = line.find(','); comma != std::string_view::npos; comma = line.find(',', from)) {
        cells.push_back(strip(line.substr(from, comma - from)));
        from = comma + 1;
    }
    cells.push_back(strip(line.substr(from)));
    return cells;
}

// Fills row from the cells. Returns the 1-based column of the first cell that is not a finite number.
std::optional<std::size_t> parse_coefficients(const std::vector<std::string_view>& cells, std::vector<double>& row) {
    row.assign(cells.size(), 0.0);
    for (std::size_t c = 0; c < cells.size(); ++c) {
        const std::string_view cell = cells[c];
        if (cell.empty()) {
            return c + 1;
        }
        const char* last = cell.data() + cell.size();
        const auto [end, ec] = std::from_chars(cell.data(), last, row[c]);
        if (ec != std::errc{} || end != last || !std::isfinite(row[c])) {
            return c + 1;
        }
    }
    return std::nullopt;
}

} // namespace

bool load_correlation_csv(const std::string& path, Eigen::MatrixXd& correlation) {
    std::ifstream input(path);
    if (!input.is_open()) {
        spdlog::error("Failed to open correlation CSV: {}", path);
        return false;
    }

    std::vector<std::vector<double>> rows;
    std::vector<double> row;
    std::string line;
    std::size_t line_number = 0;
    while (std::getline(input, line)) {
        ++line_number;
        if (strip(line).empty()) {
            continue;
        }
        if (const auto bad_column = parse_coefficients(split_cells(line), row)) {
            if (rows.empty() && line_number == 1) {
                continue; // header of labels
            }
            spdlog::error("Correlation CSV {}: cell at line {}, column {} is not a finite number",
                          path, line_number, *bad_column);
            return false;
        }
        if (!rows.empty() && row.size() != rows.front().size()) {
            spdlog::error("Correlation CSV {}: line {} has {} coefficients, expected {}",
                          path, line_number, row.size(), rows.front().size());
            return false;
        }
        rows.push_back(row);
    }

    if (rows.empty() || rows.size() != rows.front().size()) {
        spdlog::error("Correlation CSV {} is not a non-empty square matrix ({} rows)", path, rows.size());
        return false;
    }

    const Eigen::Index dim = static_cast<Eigen::Index>(rows.size());
    correlation.resize(dim, dim);
    for (Eigen::Index r = 0; r < dim; ++r) {
        for (Eigen::Index c = 0; c < dim; ++c) {
            correlation(r, c) = rows[static_cast<std::size_t>(r)][static_cast<std::size_t>(c)];
        }
    }
    spdlog::debug("Loaded {}x{} correlation matrix from '{}'", dim, dim, path);
    return true;
}

} // namespace esg
