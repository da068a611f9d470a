#include <iostream>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include <cassert>
#include <nlohmann/json.hpp>
#include "src/Errors.hpp"
#include "src/Params.hpp"
#include "src/Tables.hpp"
#include "src/io/json_loader.hpp"
#include "src/io/csv_io.h"
#include "src/engine/RunOrchestrator.h"

using namespace Kapital;
using json = nlohmann::json;
namespace fs = std::filesystem;

static json minimal_config() {
    return json::parse(R"({
        "parameters": {"r": 0.05, "delta": 0.1, "w": 2.0, "pk": 1.0, "elast": -2.0, "scale": 1.0},
        "p": 1.0,
        "cap0": 10.0,
        "in": "input",
        "out_ex": "output-ex",
        "out_en": "output-en"
    })");
}

template <typename F>
static bool throws(F f) {
    try { f(); } catch (const std::exception& e) {
        std::cout << "  " << e.what() << std::endl;
        return true;
    }
    return false;
}

static void write_file(const fs::path& path, const std::string& text) {
    std::ofstream f(path);
    f << text;
}

static void test_parse_config() {
    std::cout << "Config parsing..." << std::endl;

    json data = minimal_config();
    data["endog_p"] = false;
    data["roll"] = {{"r05", {{"base", "r01-baseline"}, {"year", 10}}},
                    {"r06", {{"base", "r02-itc"}, {"year", 5}, {"cap0", 3.5}}}};
    data["inertial"] = {"r04"};
    data["solver"] = {{"max_iter", 40}, {"tol", 1e-9}};
    data["legend"] = {{"r01-baseline", "Baseline"}, {"r02-itc", "ITC"}};

    ModelConfig cfg = JsonLoader::parse_config(data);

    assert(cfg.params.r == 0.05 && cfg.params.w == 2.0 && cfg.params.elast == -2.0);
    assert(cfg.p0 == 1.0);
    assert(cfg.cap0 == 10.0);
    assert(!cfg.endog_p);
    assert(cfg.out_dir() == "output-ex");
    assert(cfg.closure_tag() == "ex");

    const RollingSpec* r05 = cfg.rolling_spec("r05");
    assert(r05 && r05->base == "r01-baseline" && r05->year == 10 && !r05->has_cap0);
    const RollingSpec* r06 = cfg.rolling_spec("r06");
    assert(r06 && r06->has_cap0 && r06->cap0 == 3.5);
    assert(cfg.rolling_spec("r02") == nullptr);

    assert(cfg.is_inertial("r04"));
    assert(!cfg.is_inertial("r05"));
    assert(cfg.solver.max_iter == 40 && cfg.solver.tol == 1e-9);
    assert(cfg.legend.at("r02-itc") == "ITC");

    // Defaults
    ModelConfig dflt = JsonLoader::parse_config(minimal_config());
    assert(dflt.endog_p);
    assert(!dflt.base_only && !dflt.force);
    assert(dflt.baseline == "r01-baseline");
    assert(dflt.out_cm == "output-cm");
    assert(dflt.last_year == 30);
    assert(dflt.roll.empty() && dflt.inertial.empty());
}

static void test_config_errors() {
    std::cout << "Config errors..." << std::endl;

    json no_w = minimal_config();
    no_w["parameters"].erase("w");
    assert(throws([&] { JsonLoader::parse_config(no_w); }));

    json no_out = minimal_config();
    no_out.erase("out_en");
    assert(throws([&] { JsonLoader::parse_config(no_out); }));

    json bad_elast = minimal_config();
    bad_elast["parameters"]["elast"] = 0.0;
    assert(throws([&] { JsonLoader::parse_config(bad_elast); }));

    json bad_roll = minimal_config();
    bad_roll["roll"] = {{"r05", {{"base", "r01-baseline"}, {"year", 2.5}}}};
    assert(throws([&] { JsonLoader::parse_config(bad_roll); }));

    json no_base = minimal_config();
    no_base["roll"] = {{"r05", {{"year", 2}}}};
    assert(throws([&] { JsonLoader::parse_config(no_base); }));

    assert(throws([] { JsonLoader::load_config("no-such-config.json"); }));
}

static void test_run_order() {
    std::cout << "Run ordering..." << std::endl;

    ModelConfig cfg = JsonLoader::parse_config(minimal_config());
    RollingSpec a;
    a.base = "r09-late-base";
    a.year = 2;
    cfg.roll["r02"] = a;

    std::vector<std::string> order = RunOrchestrator::order_runs(
        {"r03-other", "r02-rolls-late", "r01-baseline", "r09-late-base"}, cfg);
    assert(order.size() == 4);
    assert(order[0] == "r01-baseline");
    assert(order[1] == "r09-late-base");
    assert(order[2] == "r02-rolls-late");
    assert(order[3] == "r03-other");

    // r09 rolls off r02, r02 rolls off r09
    RollingSpec b;
    b.base = "r02-rolls-late";
    b.year = 1;
    cfg.roll["r09"] = b;
    assert(throws([&] {
        RunOrchestrator::order_runs({"r02-rolls-late", "r09-late-base"}, cfg);
    }));
}

static void test_csv(const fs::path& dir) {
    std::cout << "CSV files..." << std::endl;

    // Unsorted rows, columns in any order, an extra column
    fs::path good = dir / "r01-baseline.csv";
    write_file(good,
               "td,period,a,note,sub,itc\n"
               "0.2,2,1.5,7,0.1,0\n"
               "0.2,0,1.0,7,0,0.05\n"
               "\n"
               "0.2,1,1.25,7,0,0\n");
    ExogenousTable exo = CsvIO::read_exogenous(good.string());
    assert(exo.rows() == 3);
    assert(exo.index == PeriodIndex::range(0, 3));
    assert(exo.a[0] == 1.0 && exo.a[1] == 1.25 && exo.a[2] == 1.5);
    assert(exo.itc[0] == 0.05);
    assert(exo.sub[2] == 0.1);
    assert(exo.td[1] == 0.2);

    fs::path dup = dir / "dup.csv";
    write_file(dup, "period,a,sub,itc,td\n0,1,0,0,0\n0,1,0,0,0\n");
    assert(throws([&] { CsvIO::read_exogenous(dup.string()); }));

    fs::path bad = dir / "bad.csv";
    write_file(bad, "period,a,sub,itc,td\n0,1,x,0,0\n");
    assert(throws([&] { CsvIO::read_exogenous(bad.string()); }));

    fs::path short_row = dir / "short.csv";
    write_file(short_row, "period,a,sub,itc,td\n0,1,0,0\n");
    assert(throws([&] { CsvIO::read_exogenous(short_row.string()); }));

    fs::path missing_col = dir / "missing.csv";
    write_file(missing_col, "period,a,sub,td\n0,1,0,0\n");
    assert(throws([&] { CsvIO::read_exogenous(missing_col.string()); }));

    assert(throws([&] { CsvIO::read_exogenous((dir / "absent.csv").string()); }));

    // Written results read back unchanged
    ResultTable d(PeriodIndex({4, 5, 7}));
    double v = 0.1;
    for (const auto& c : ResultTable::columns()) {
        Eigen::VectorXd& col = d.*c.second;
        for (int i = 0; i < d.rows(); ++i) {
            col[i] = v / 3.0;
            v += 1.0;
        }
    }
    fs::path out = dir / "result.csv";
    CsvIO::write_results(out.string(), d);
    ResultTable back = CsvIO::read_results(out.string());
    assert(back.index == d.index);
    for (const auto& c : ResultTable::columns()) {
        for (int i = 0; i < d.rows(); ++i) assert((back.*c.second)[i] == (d.*c.second)[i]);
    }
}

int main() {
    std::cout << "Testing configuration and CSV I/O..." << std::endl;

    fs::path dir = fs::temp_directory_path() / "kapital_test_config_io";
    fs::remove_all(dir);
    fs::create_directories(dir);

    test_parse_config();
    test_config_errors();
    test_run_order();
    test_csv(dir);

    fs::remove_all(dir);
    std::cout << "SUCCESS: Configuration and CSV I/O verified." << std::endl;
    return 0;
}
