// Demo of the listops list operations on a small tag-comparison task

#include "listops/listops.hpp"
#include <algorithm>
#include <iostream>
#include <string>
#include <vector>

using Strings = std::vector<std::string>;

static void print(const char* label, Strings values, bool unordered = false) {
    // Set-backed results have no stable order; sort them for display
    if (unordered) {
        std::sort(values.begin(), values.end());
    }
    std::cout << "  " << label << ": [" << listops::join(values, ", ") << "]\n";
}

int main() {
    std::cout << "listops Demo\n";
    std::cout << "============\n\n";

    Strings monday = listops::split("build,test,deploy,test");
    Strings tuesday = listops::split("test lint deploy", listops::WHITE_SPACE_DELIMITER);

    std::cout << "Parsed task lists:\n";
    print("monday", monday);
    print("tuesday", tuesday);
    std::cout << "  monday has repeats: " << std::boolalpha
              << listops::has_duplicates(monday) << "\n\n";

    std::cout << "Combining:\n";
    print("concat", listops::concat(monday, tuesday));
    print("concat_all", listops::concat_all<std::string>({monday, listops::None, tuesday}));
    print("merge", listops::merge(monday, tuesday), true);

    std::cout << "\nComparing:\n";
    print("both days", listops::intersection(monday, tuesday), true);
    print("only monday", listops::difference(monday, tuesday));
    print("one day only", listops::full_difference(monday, tuesday), true);

    std::cout << "\nArrays:\n";
    listops::Array<std::string> frozen = listops::to_array(tuesday);
    std::cout << "  to_array length: " << frozen.len() << "\n";
    std::cout << "  first: " << frozen.first().unwrap_or(listops::EMPTY) << "\n";
    print("to_list", listops::to_list(frozen));

    std::cout << "\nEmpty inputs never throw:\n";
    Strings nothing;
    print("merge(monday, {})", listops::merge(monday, nothing));
    print("merge_all(monday, {})", listops::merge_all<std::string>({monday, nothing}), true);
    print("difference(monday, {})", listops::difference(monday, nothing));

    std::cout << "\n✓ Demo complete!\n";
    return 0;
}
