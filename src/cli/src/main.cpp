#include <cli/cli.h>

int main(int count, const char **args) {
    arbor::cli::CLIOptions options(count, args);

    return options.status;
}
