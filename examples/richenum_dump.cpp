#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include "richenum.hpp"
#include "common/cli/dump_params.hpp"
#include "common/order_status.hpp"

using namespace richenum;
using richenum::examples::OrderStatus;

// -----------------------------------------------------------------------------
// Listing
// -----------------------------------------------------------------------------
static void list_visible() {
    std::cout << OrderStatus::sorted_visible_entries().size() << " visible of "
              << OrderStatus::size() << " members (default: ";
    if (const OrderStatus* def = OrderStatus::get_default()) {
        std::cout << *def;
    } else {
        std::cout << "none";
    }
    std::cout << ")\n";
    for (const OrderStatus* m : OrderStatus::sorted_visible_entries()) {
        std::cout << "  " << m->clone() << "\n";
    }
}

// -----------------------------------------------------------------------------
// Matching decoded entries against the live registry
// -----------------------------------------------------------------------------
static void match_entries(const std::vector<EnumEntry>& entries) {
    std::size_t unknown = 0;
    for (const EnumEntry& e : entries) {
        const OrderStatus* m = nullptr;
        if (OrderStatus::try_find(e.oid, m)) {
            std::cout << "  [match]   " << e << (m->value() == e.value ? "" : " (value differs)") << "\n";
        } else if (OrderStatus::try_from_text(e.text, m)) {
            std::cout << "  [text]    " << e << " -> " << m->clone() << "\n";
        } else {
            std::cout << "  [unknown] " << e << "\n";
            ++unknown;
        }
    }
    std::cout << entries.size() << " entries read, " << unknown << " unknown\n";
}

// -----------------------------------------------------------------------------
// Main
// -----------------------------------------------------------------------------
int main(int argc, char** argv) {
    const auto params = examples::cli::configure(argc, argv,
        "richenum - OrderStatus registry dump\n"
        "Writes, reads and resolves the entries of a demo enumeration.\n");
    params.dump("=== richenum_dump parameters ===", std::cout);

    try {
        if (!params.parse.empty()) {
            const OrderStatus* m = nullptr;
            if (OrderStatus::try_parse(params.parse, m)) {
                std::cout << "'" << params.parse << "' -> " << m->clone() << "\n";
            } else {
                std::cout << "'" << params.parse << "' does not name an OrderStatus\n";
            }
        }

        if (params.out_file == "-") {
            OrderStatus::to_json(std::cout);
            std::cout << "\n";
        } else if (!params.out_file.empty()) {
            OrderStatus::to_json(std::filesystem::path{params.out_file});
            std::cout << OrderStatus::size() << " entries written to " << params.out_file << "\n";
        } else if (!params.in_file.empty()) {
            match_entries(OrderStatus::from_json(std::filesystem::path{params.in_file}));
        } else if (params.parse.empty()) {
            list_visible();
        }
    } catch (const richenum::error& e) {
        RE_ERROR("[DUMP] " << to_string(e.code()) << ": " << e.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
