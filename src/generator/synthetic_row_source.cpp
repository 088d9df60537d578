#include <bankgen/generator/synthetic_row_source.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <string_view>

namespace bankgen {

namespace {

// IBGE codes of the 27 federative units.
constexpr std::array<std::int64_t, 27> kStateCodes = {11, 12, 13, 14, 15, 16, 17, 21, 22,
                                                      23, 24, 25, 26, 27, 28, 29, 31, 32,
                                                      33, 35, 41, 42, 43, 50, 51, 52, 53};

constexpr std::array<std::string_view, 27> kStateAbbrevs = {
    "RO", "AC", "AM", "RR", "PA", "AP", "TO", "MA", "PI", "CE", "RN", "PB", "PE", "AL",
    "SE", "BA", "MG", "ES", "RJ", "SP", "PR", "SC", "RS", "MS", "MT", "GO", "DF"};

constexpr std::array<std::string_view, 20> kFirstNames = {
    "Ana",    "Bruno",  "Carla",   "Daniel", "Eduarda", "Felipe",  "Gabriela",
    "Hugo",   "Isabela", "Joao",   "Larissa", "Lucas",  "Mariana", "Mateus",
    "Natalia", "Pedro", "Rafaela", "Rodrigo", "Sofia",  "Thiago"};

constexpr std::array<std::string_view, 16> kLastNames = {
    "Silva",   "Santos",  "Oliveira", "Souza",    "Rodrigues", "Ferreira", "Alves", "Pereira",
    "Lima",    "Gomes",   "Costa",    "Ribeiro",  "Martins",   "Carvalho", "Rocha", "Almeida"};

constexpr std::array<std::string_view, 4> kEmailDomains = {"example.com", "mail.com",
                                                           "banco.demo", "email.com.br"};

constexpr std::array<std::string_view, 10> kCategories = {
    "Alimentacao", "Transporte", "Saude",     "Educacao",   "Lazer",
    "Vestuario",   "Viagem",     "Moradia",   "Eletronicos", "Servicos"};

constexpr std::array<std::string_view, 10> kCities = {
    "Sao Paulo", "Rio de Janeiro", "Belo Horizonte", "Salvador", "Fortaleza",
    "Curitiba",  "Recife",         "Porto Alegre",   "Manaus",   "Brasilia"};

constexpr std::array<int, 12> kAreaCodes = {11, 21, 31, 41, 51, 61, 71, 81, 85, 91, 27, 62};

constexpr std::int64_t kNanosPerDay = 86'400'000'000'000LL;

auto is_id(std::string_view name) -> bool { return name.starts_with("id_"); }

template <typename Container>
auto pick(const Container& values, std::mt19937_64& rng) -> const typename Container::value_type& {
    std::uniform_int_distribution<std::size_t> dist(0, values.size() - 1);
    return values[dist(rng)];
}

// CPF digits with valid check digits, formatted as ###.###.###-##.
auto make_cpf(std::mt19937_64& rng) -> std::string {
    std::uniform_int_distribution<int> digit(0, 9);
    std::array<int, 11> d{};
    for (std::size_t i = 0; i < 9; ++i) {
        d[i] = digit(rng);
    }
    for (std::size_t check = 9; check < 11; ++check) {
        int sum = 0;
        for (std::size_t i = 0; i < check; ++i) {
            sum += d[i] * static_cast<int>(check + 1 - i);
        }
        int rest = (sum * 10) % 11;
        d[check] = rest == 10 ? 0 : rest;
    }
    return fmt::format("{}{}{}.{}{}{}.{}{}{}-{}{}", d[0], d[1], d[2], d[3], d[4], d[5], d[6],
                       d[7], d[8], d[9], d[10]);
}

auto round_cents(double value) -> double { return std::round(value * 100.0) / 100.0; }

}  // namespace

SyntheticRowSource::SyntheticRowSource() : SyntheticRowSource(SyntheticOptions{}) {}

SyntheticRowSource::SyntheticRowSource(SyntheticOptions options)
    : options_(options), rng_(options.seed ? *options.seed : std::random_device{}()) {}

auto SyntheticRowSource::generate(const std::string& table, const Schema& schema,
                                  std::size_t count) -> Table {
    Table out;
    for (std::size_t i = 0; i < schema.size(); ++i) {
        const auto& field = schema.fields()[i];
        out.add_column(field.name, make_column(field, i == 0, count));
    }
    spdlog::info("generated {} rows for table '{}'", count, table);
    return out;
}

auto SyntheticRowSource::make_column(const Field& field, bool leading, std::size_t count)
    -> ColumnValue {
    switch (field.kind) {
        case ColumnKind::Int:
            return make_int(field, leading, count);
        case ColumnKind::Double:
            return make_double(field, count);
        case ColumnKind::Date:
            return make_date(field, count);
        case ColumnKind::Timestamp:
            return make_timestamp(count);
        case ColumnKind::String:
            break;
    }
    return make_string(field, count);
}

auto SyntheticRowSource::make_int(const Field& field, bool leading, std::size_t count)
    -> ColumnValue {
    Column<std::int64_t> col;
    col.reserve(count);
    const auto& name = field.name;

    if (name == "id_uf") {
        for (std::size_t i = 0; i < count; ++i) {
            col.push_back(pick(kStateCodes, rng_));
        }
        return col;
    }
    if (is_id(name) && leading) {
        for (std::size_t i = 0; i < count; ++i) {
            col.push_back(static_cast<std::int64_t>(i) + 1);
        }
        return col;
    }

    std::int64_t lo = 0;
    std::int64_t hi = 1000;
    if (field.type == "boolean") {
        hi = 1;
    } else if (is_id(name)) {
        lo = 1;
        hi = std::max<std::int64_t>(options_.key_range, 1);
    } else if (name == "idade") {
        lo = 18;
        hi = 90;
    } else if (name.starts_with("score")) {
        lo = 300;
        hi = 1000;
    } else if (name.starts_with("num_") || name.starts_with("qtd_")) {
        hi = 100;
    }
    std::uniform_int_distribution<std::int64_t> dist(lo, hi);
    for (std::size_t i = 0; i < count; ++i) {
        col.push_back(dist(rng_));
    }
    return col;
}

auto SyntheticRowSource::make_double(const Field& field, std::size_t count) -> ColumnValue {
    Column<double> col;
    col.reserve(count);
    const auto& name = field.name;

    if (name == "valor") {
        // Card purchases: mostly small, with a long tail.
        std::lognormal_distribution<double> dist(4.0, 1.0);
        for (std::size_t i = 0; i < count; ++i) {
            col.push_back(round_cents(std::min(dist(rng_) + 1.0, 20'000.0)));
        }
        return col;
    }
    if (name == "limite_credito") {
        std::uniform_int_distribution<int> hundreds(5, 500);
        for (std::size_t i = 0; i < count; ++i) {
            col.push_back(hundreds(rng_) * 100.0);
        }
        return col;
    }

    double hi = name.starts_with("saldo") || name.starts_with("renda") ? 50'000.0 : 10'000.0;
    std::uniform_real_distribution<double> dist(0.0, hi);
    for (std::size_t i = 0; i < count; ++i) {
        col.push_back(round_cents(dist(rng_)));
    }
    return col;
}

auto SyntheticRowSource::make_string(const Field& field, std::size_t count) -> ColumnValue {
    const auto& name = field.name;

    if (name == "categoria" || name == "uf" || name == "estado" || name == "cidade") {
        Column<Categorical> col;
        col.reserve(count);
        for (std::size_t i = 0; i < count; ++i) {
            if (name == "categoria") {
                col.push_back(pick(kCategories, rng_));
            } else if (name == "cidade") {
                col.push_back(pick(kCities, rng_));
            } else {
                col.push_back(pick(kStateAbbrevs, rng_));
            }
        }
        return col;
    }

    Column<std::string> col;
    col.reserve(count);
    std::uniform_int_distribution<int> number(0, 9999);
    for (std::size_t i = 0; i < count; ++i) {
        if (name == "nome") {
            col.push_back(fmt::format("{} {} {}", pick(kFirstNames, rng_), pick(kLastNames, rng_),
                                      pick(kLastNames, rng_)));
        } else if (name == "email") {
            col.push_back(fmt::format("{}.{}{}@{}", pick(kFirstNames, rng_),
                                      pick(kLastNames, rng_), number(rng_),
                                      pick(kEmailDomains, rng_)));
        } else if (name == "cpf") {
            col.push_back(make_cpf(rng_));
        } else if (name == "telefone") {
            col.push_back(fmt::format("({}) 9{:04}-{:04}", pick(kAreaCodes, rng_), number(rng_),
                                      number(rng_)));
        } else {
            col.push_back(fmt::format("{}_{}", name, i + 1));
        }
    }
    return col;
}

auto SyntheticRowSource::make_date(const Field& field, std::size_t count) -> ColumnValue {
    Column<Date> col;
    col.reserve(count);
    // Birth dates fall 18 to 80 years back; everything else within five years.
    std::int32_t newest = 0;
    std::int32_t oldest = 5 * 365;
    if (field.name == "data_nascimento") {
        newest = 18 * 365;
        oldest = 80 * 365;
    }
    std::uniform_int_distribution<std::int32_t> back(newest, oldest);
    for (std::size_t i = 0; i < count; ++i) {
        col.push_back(Date{options_.today.days - back(rng_)});
    }
    return col;
}

auto SyntheticRowSource::make_timestamp(std::size_t count) -> ColumnValue {
    Column<Timestamp> col;
    col.reserve(count);
    auto end = static_cast<std::int64_t>(options_.today.days) * kNanosPerDay;
    std::uniform_int_distribution<std::int64_t> back(1, 365 * kNanosPerDay);
    for (std::size_t i = 0; i < count; ++i) {
        col.push_back(Timestamp{end - back(rng_)});
    }
    return col;
}

}  // namespace bankgen
