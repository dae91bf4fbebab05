/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <cstdint>
#include <iostream>
#include <string>

#include <boost/program_options.hpp>
#include <seastar/core/app-template.hh>
#include <seastar/core/future.hh>

#include "isets/evaluate.hh"
#include "isets/exceptions.hh"
#include "isets/log.hh"

namespace bpo = boost::program_options;

// === How to run
//
// ./isets-tool --operation union --lhs '{1..3, 7}' --rhs '{4..5}'
// {1..5, 7}
//
// ./isets-tool --domain real --operation complement --lhs '{0..1}'
// {-inf..<0, 1<..inf}
//
// ./isets-tool --operation contains --lhs '{1..3, 7}' --value 2..3
// true

static isets::operation_request make_request(const bpo::variables_map& config) {
    isets::operation_request req;
    req.operation = config["operation"].as<std::string>();
    req.lhs = config["lhs"].as<std::string>();
    req.rhs = config["rhs"].as<std::string>();
    if (config.count("value")) {
        req.value = config["value"].as<std::string>();
    }
    return req;
}

int main(int ac, char** av) {
    seastar::app_template::config app_cfg;
    app_cfg.name = "isets-tool";
    app_cfg.description = "Evaluates operations on sets of disjoint intervals.";
    seastar::app_template app(std::move(app_cfg));
    app.add_options()
        ("operation", bpo::value<std::string>()->default_value("normalize"),
            "one of normalize, complement, contains, union, difference, intersection, symmetric-difference")
        ("lhs", bpo::value<std::string>()->default_value("{}"), "left hand side set, e.g. '{1..3, 5<..<9}'")
        ("rhs", bpo::value<std::string>()->default_value("{}"), "right hand side set")
        ("value", bpo::value<std::string>(), "value or interval to look up with the contains operation")
        ("domain", bpo::value<std::string>()->default_value("integer"), "value domain: integer or real");

    return app.run(ac, av, [&app] {
        auto& config = app.configuration();
        try {
            const auto domain = config["domain"].as<std::string>();
            std::string result;
            if (domain == "integer") {
                result = isets::evaluate<int64_t>(make_request(config));
            } else if (domain == "real") {
                result = isets::evaluate<double>(make_request(config));
            } else {
                throw bpo::invalid_option_value(domain);
            }
            std::cout << result << "\n";
            return seastar::make_ready_future<int>(0);
        } catch (const isets::interval_set_exception& e) {
            isets::isets_logger.error("{}: {}", isets::error_map().at(e.code()), e.what());
        } catch (const bpo::error& e) {
            isets::isets_logger.error("invalid option: {}", e.what());
        }
        return seastar::make_ready_future<int>(1);
    });
}
