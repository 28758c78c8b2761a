#include "mdclone/log.h"
#include "mdclone/xml_store.h"
#include "mdclonectl/cli_api.h"

#include <libxml/parser.h>

#include <iostream>
#include <string>

int main(int argc, char** argv) {
  if (argc < 2) {
    print_usage();
    return 1;
  }

  const std::string command = argv[1];
  CliOptions opts;
  std::string error;
  if (!parse_cli_options(argc, argv, 2, opts, error)) {
    std::cerr << error << "\n";
    print_usage();
    return 1;
  }

  xmlInitParser();
  mdclone::log::init("mdclonectl", opts.log_dir.value_or(std::filesystem::path()));
  mdclone::xml::route_errors_to_log();

  int rc = 1;
  if (command == "clone") {
    rc = clone_entity(opts);
  } else if (command == "remove") {
    rc = remove_entity(opts);
  } else if (command == "inspect") {
    rc = inspect_type(opts);
  } else {
    print_usage();
  }

  mdclone::log::shutdown();
  xmlCleanupParser();
  return rc;
}
