#include <chartedit/ChartEdit.hpp>

#include <cstdlib>
#include <iostream>

int main(int argc, char** argv) {
    auto options = CE::ParseChartEditArguments(argc, argv);
    if (!options) {
        CE::PrintChartEditUsage();
        return EXIT_FAILURE;
    }
    if (options->show_help) {
        CE::PrintChartEditUsage();
        return EXIT_SUCCESS;
    }
    if (auto problem = CE::ValidateChartEditOptions(*options)) {
        std::cerr << "chartedit_cli: " << *problem << "\n";
        CE::PrintChartEditUsage();
        return EXIT_FAILURE;
    }

    auto store = CE::make_document_store(*options);

    CE::Skills::SkillArguments args;
    args.saved_payload_id = options->payload_id;
    if (options->updates) {
        args.updates = CE::Json(*options->updates);
    }
    args.instructions = options->instructions;
    args.actor        = options->actor;
    args.indent       = options->pretty_indent;

    auto output = CE::Skills::run_skill(options->command, *store, args);
    if (!output) {
        std::cerr << "chartedit_cli: " << CE::describeError(output.error()) << std::endl;
        return EXIT_FAILURE;
    }

    std::cout << output->final_prompt << "\n";
    if (!output->narrative.empty()) {
        std::cout << "\n" << output->narrative << "\n";
    }
    for (auto const& visualization : output->visualizations) {
        std::cout << "\n" << visualization.dump(options->pretty_indent) << "\n";
    }
    return EXIT_SUCCESS;
}
