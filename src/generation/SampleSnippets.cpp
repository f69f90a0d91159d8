#include "codetyper/generation/SampleSnippets.hpp"
#include <array>

namespace codetyper::generation
{
namespace
{

constexpr std::string_view g_pythonSnippet{ R"snippet(# Binary Search implementation in Python
def binary_search(arr, target):
    '''
    Performs binary search on a sorted array.

    Args:
        arr: A sorted list of elements
        target: The element to search for

    Returns:
        int: The index of the target element, or -1 if not found
    '''
    left, right = 0, len(arr) - 1

    while left <= right:
        mid = (left + right) // 2

        # Check if target is present at mid
        if arr[mid] == target:
            return mid

        # If target is greater, ignore left half
        elif arr[mid] < target:
            left = mid + 1

        # If target is smaller, ignore right half
        else:
            right = mid - 1

    # Element is not present in array
    return -1

# Example usage
def main():
    # Test array
    sorted_array = [2, 3, 4, 10, 40, 50, 70, 80, 90, 100]

    # Element to search
    target = 10

    # Function call
    result = binary_search(sorted_array, target)

    if result != -1:
        print(f"Element {target} is present at index {result}")
    else:
        print(f"Element {target} is not present in array")

    # Additional examples
    for test_target in [2, 30, 70, 100, 110]:
        result = binary_search(sorted_array, test_target)
        if result != -1:
            print(f"Element {test_target} is present at index {result}")
        else:
            print(f"Element {test_target} is not present in array")

if __name__ == "__main__":
    main()
)snippet" };

constexpr std::string_view g_cppSnippet{ R"snippet(// Binary Search implementation in C++
#include <iostream>
#include <vector>

/**
 * Performs binary search on a sorted array.
 *
 * @param arr The sorted array to search in
 * @param target The element to search for
 * @return The index of the target element, or -1 if not found
 */
int binarySearch(const std::vector<int>& arr, int target) {
    int left = 0;
    int right = arr.size() - 1;

    while (left <= right) {
        int mid = left + (right - left) / 2;

        // Check if target is present at mid
        if (arr[mid] == target)
            return mid;

        // If target is greater, ignore left half
        if (arr[mid] < target)
            left = mid + 1;

        // If target is smaller, ignore right half
        else
            right = mid - 1;
    }

    // Element is not present in array
    return -1;
}

int main() {
    // Test array
    std::vector<int> sortedArray = {2, 3, 4, 10, 40, 50, 70, 80, 90, 100};

    // Element to search
    int target = 10;

    // Function call
    int result = binarySearch(sortedArray, target);

    if (result != -1)
        std::cout << "Element " << target << " is present at index " << result << std::endl;
    else
        std::cout << "Element " << target << " is not present in array" << std::endl;

    // Additional examples
    int testTargets[] = {2, 30, 70, 100, 110};
    for (int testTarget : testTargets) {
        result = binarySearch(sortedArray, testTarget);
        if (result != -1)
            std::cout << "Element " << testTarget << " is present at index " << result << std::endl;
        else
            std::cout << "Element " << testTarget << " is not present in array" << std::endl;
    }

    return 0;
}
)snippet" };

constexpr std::string_view g_javaSnippet{ R"snippet(// Binary Search implementation in Java
public class BinarySearch {
    /**
     * Performs binary search on a sorted array.
     *
     * @param arr The sorted array to search in
     * @param target The element to search for
     * @return The index of the target element, or -1 if not found
     */
    public static int binarySearch(int[] arr, int target) {
        int left = 0;
        int right = arr.length - 1;

        while (left <= right) {
            int mid = left + (right - left) / 2;

            // Check if target is present at mid
            if (arr[mid] == target)
                return mid;

            // If target is greater, ignore left half
            if (arr[mid] < target)
                left = mid + 1;

            // If target is smaller, ignore right half
            else
                right = mid - 1;
        }

        // Element is not present in array
        return -1;
    }

    public static void main(String[] args) {
        // Test array
        int[] sortedArray = {2, 3, 4, 10, 40, 50, 70, 80, 90, 100};

        // Element to search
        int target = 10;

        // Function call
        int result = binarySearch(sortedArray, target);

        if (result != -1)
            System.out.println("Element " + target + " is present at index " + result);
        else
            System.out.println("Element " + target + " is not present in array");

        // Additional examples
        int[] testTargets = {2, 30, 70, 100, 110};
        for (int testTarget : testTargets) {
            result = binarySearch(sortedArray, testTarget);
            if (result != -1)
                System.out.println("Element " + testTarget + " is present at index " + result);
            else
                System.out.println("Element " + testTarget + " is not present in array");
        }
    }
}
)snippet" };

constexpr std::string_view g_rustSnippet{ R"snippet(// Binary Search implementation in Rust
fn binary_search(arr: &[i32], target: i32) -> Option<usize> {
    let mut left = 0;
    let mut right = arr.len();

    while left < right {
        let mid = left + (right - left) / 2;

        // Check if target is present at mid
        if arr[mid] == target {
            return Some(mid);
        }

        // If target is greater, ignore left half
        if arr[mid] < target {
            left = mid + 1;
        }
        // If target is smaller, ignore right half
        else {
            right = mid;
        }
    }

    // Element is not present in array
    None
}

fn main() {
    // Test array
    let sorted_array = [2, 3, 4, 10, 40, 50, 70, 80, 90, 100];

    // Element to search
    let target = 10;

    // Function call
    match binary_search(&sorted_array, target) {
        Some(index) => println!("Element {} is present at index {}", target, index),
        None => println!("Element {} is not present in array", target),
    }

    // Additional examples
    let test_targets = [2, 30, 70, 100, 110];
    for &test_target in &test_targets {
        match binary_search(&sorted_array, test_target) {
            Some(index) => println!("Element {} is present at index {}", test_target, index),
            None => println!("Element {} is not present in array", test_target),
        }
    }
}
)snippet" };

constexpr std::string_view g_javaScriptSnippet{ R"snippet(// Binary Search implementation in JavaScript
/**
 * Performs binary search on a sorted array.
 *
 * @param {Array} arr - The sorted array to search in
 * @param {number} target - The element to search for
 * @return {number} - The index of the target element, or -1 if not found
 */
function binarySearch(arr, target) {
    let left = 0;
    let right = arr.length - 1;

    while (left <= right) {
        const mid = Math.floor((left + right) / 2);

        // Check if target is present at mid
        if (arr[mid] === target) {
            return mid;
        }

        // If target is greater, ignore left half
        if (arr[mid] < target) {
            left = mid + 1;
        }
        // If target is smaller, ignore right half
        else {
            right = mid - 1;
        }
    }

    // Element is not present in array
    return -1;
}

// Test array
const sortedArray = [2, 3, 4, 10, 40, 50, 70, 80, 90, 100];

// Element to search
const target = 10;

// Function call
const result = binarySearch(sortedArray, target);

if (result !== -1) {
    console.log(`Element ${target} is present at index ${result}`);
} else {
    console.log(`Element ${target} is not present in array`);
}

// Additional examples
const testTargets = [2, 30, 70, 100, 110];
for (const testTarget of testTargets) {
    const testResult = binarySearch(sortedArray, testTarget);
    if (testResult !== -1) {
        console.log(`Element ${testTarget} is present at index ${testResult}`);
    } else {
        console.log(`Element ${testTarget} is not present in array`);
    }
}
)snippet" };

struct SnippetEntry final
{
    Language language;
    std::string_view text;
};

constexpr std::array<SnippetEntry, 5> g_snippetTable{ {
    { Language::Python, g_pythonSnippet },
    { Language::Cpp, g_cppSnippet },
    { Language::Java, g_javaSnippet },
    { Language::Rust, g_rustSnippet },
    { Language::JavaScript, g_javaScriptSnippet },
} };

} // namespace

std::string_view builtinSnippet(Language language) noexcept
{
    for (const auto& entry : g_snippetTable)
    {
        if (entry.language == language)
        {
            return entry.text;
        }
    }
    return g_pythonSnippet;
}

} // namespace codetyper::generation
