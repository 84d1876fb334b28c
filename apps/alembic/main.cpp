/*
 * Alembic - Lowering typed object trees into Elixir source
 * Copyright (C) 2025  Ivan Pidhurskyi
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */


#include "alembic/compiler.hpp"
#include "alembic/exceptions.hpp"
#include "alembic/logging.hpp"
#include "alembic/sexpr_parser.hpp"
#include "alembic/transform/pipeline.hpp"
#include "alembic/utilities/execution_timer.hpp"

#include <boost/program_options.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace std {
namespace fs = std::filesystem;
}


static void
usage(std::ostream &os, const char *argv0,
      const boost::program_options::options_description &desc)
{
  os << "Usage: " << argv0 << " [options] input-file" << std::endl;
  os << desc << std::endl;
}


int
main(int argc, char **argv)
{
  namespace po = boost::program_options;
  using namespace alm;

  std::string verbosity {loglevel_name(loglevel::info)};
  std::vector<std::string> disabled;

  po::options_description desc {"Allowed options"};
  desc.add_options()
    ("help,h", "produce help message")
    ("input-file", po::value<std::fs::path>(), "typed tree to compile")
    ("output,o", po::value<std::fs::path>(), "write the result to a file")
    ("verbosity,v", po::value<std::string>(&verbosity)->implicit_value("debug"),
     "verbosity level (silent, error, warning, info, debug)")
    ("disable,d", po::value<std::vector<std::string>>(&disabled),
     "disable a pass (repeatable)")
    ("list-passes", "list the passes of the pipeline and exit")
    ("dump-ast", "print the transformed tree instead of target code")
    ("timings", "report time spent in every stage");

  po::positional_options_description posdesc;
  posdesc.add("input-file", 1);

  po::variables_map varmap;
  try
  {
    auto parsedopts = po::command_line_parser(argc, argv)
                          .options(desc)
                          .positional(posdesc)
                          .run();
    po::store(parsedopts, varmap);
    po::notify(varmap);
  }
  catch (const po::error &e)
  {
    error("{}", e.what());
    usage(std::cerr, argv[0], desc);
    return EXIT_FAILURE;
  }

  if (varmap.contains("help"))
  {
    usage(std::cout, argv[0], desc);
    return EXIT_SUCCESS;
  }

  if (varmap.contains("list-passes"))
  {
    for (const std::string_view name : pipeline::default_pass_names())
      std::cout << name << std::endl;
    return EXIT_SUCCESS;
  }

  try
  {
    loglevel = parse_loglevel(verbosity);
  }
  catch (const std::runtime_error &exn)
  {
    error("{}", exn.what());
    return EXIT_FAILURE;
  }

  if (not varmap.contains("input-file"))
  {
    error("No input file provided");
    usage(std::cerr, argv[0], desc);
    return EXIT_FAILURE;
  }

  const std::fs::path inputpath = varmap["input-file"].as<std::fs::path>();
  if (not std::fs::exists(inputpath))
  {
    error("Input file '{}' does not exist", inputpath.c_str());
    return EXIT_FAILURE;
  }

  std::ifstream inputfile {inputpath, std::ios::binary};
  if (not inputfile.is_open())
  {
    error("Could not open input file '{}'", inputpath.c_str());
    return EXIT_FAILURE;
  }

  pipeline_config config;
  for (const std::string &pass : disabled)
    config.disable(pass);

  std::string output;
  try
  {
    info("Compiling '{}'", inputpath.c_str());
    sexpr_parser parser;
    const value declarations = parser.parse_all(inputfile, inputpath);

    compilation_unit unit {config};
    const ast::node_ptr tree = unit.transform(unit.build(declarations));
    output = varmap.contains("dump-ast") ? ast::dump(tree) + "\n"
                                          : unit.print(tree);
  }
  catch (const code_transformation_error &exn)
  {
    error("{}", exn.display());
    return EXIT_FAILURE;
  }
  catch (const bad_code &exn)
  {
    error("{}", exn.display());
    return EXIT_FAILURE;
  }
  catch (const internal_defect &exn)
  {
    error("internal defect in {}: {}\n{}", exn.component(), exn.what(),
          exn.subtree());
    return EXIT_FAILURE;
  }
  catch (const std::invalid_argument &exn)
  {
    error("{}", exn.what());
    return EXIT_FAILURE;
  }

  if (varmap.contains("output"))
  {
    const std::fs::path outputpath = varmap["output"].as<std::fs::path>();
    std::ofstream outputfile {outputpath, std::ios::binary};
    if (not outputfile.is_open())
    {
      error("Could not open output file '{}'", outputpath.c_str());
      return EXIT_FAILURE;
    }
    outputfile << output;
  }
  else
    std::cout << output;

  if (varmap.contains("timings"))
    execution_timer::report_global_stats();

  return EXIT_SUCCESS;
}
