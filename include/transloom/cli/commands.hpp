#pragma once

namespace transloom::cli {

int run_cli(int argc, char **argv);

} // namespace transloom::cli
