// namecheck/driver/driver.cpp - Check driver implementation
//
#include "namecheck/driver/driver.hpp"

#include <iostream>

#include "namecheck/check/name_checker.hpp"
#include "namecheck/decl/json_reader.hpp"

namespace namecheck
{

CheckResult Driver::check_file(const std::filesystem::path & file, const CheckOptions & options)
{
  CheckResult result;
  result.decls = std::make_unique<DeclContext>();
  result.success = check_one(file, options, result);
  return result;
}

CheckResult Driver::check_project(const ProjectConfig & config, const CheckOptions & options)
{
  CheckResult result;
  result.decls = std::make_unique<DeclContext>();

  if (config.inputs.empty()) {
    report_error(result.diagnostics, "project has no inputs (add an 'inputs' list to namecheck.yaml)");
    return result;
  }

  bool all_loaded = true;
  for (const auto & input : config.inputs) {
    if (!check_one(config.resolve(input), options, result)) {
      // Continue so every input gets reported
      all_loaded = false;
    }
  }

  result.success = all_loaded;
  return result;
}

bool Driver::check_one(
  const std::filesystem::path & file, const CheckOptions & options, CheckResult & result)
{
  if (options.verbose) {
    std::cerr << "Loading: " << file.string() << "\n";
  }

  const DeclLoadResult load = load_declarations_file(file, *result.decls);
  if (!load.success) {
    report_error(result.diagnostics, load.error);
    return false;
  }

  // Only the roots this file added
  const auto roots = result.decls->roots().last(load.root_count);

  NameChecker checker(&result.diagnostics);
  checker.check_all(roots);

  result.visited_count += checker.visited_count();
  result.checked_files.push_back(file);

  if (options.verbose) {
    std::cerr << "Checked " << checker.visited_count() << " declarations in " << file.string()
              << " (" << checker.warning_count() << " warnings)\n";
  }
  return true;
}

}  // namespace namecheck
