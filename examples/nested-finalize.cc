#include <alt-finalize/finalize_guard.hh>

#include <iostream>

// Replacing the destructor of an aggregate whose member has its own replacement.
// Nothing is destroyed implicitly under a finalize_guard, so outer::finalize decides
// which member cleanup runs, in which order and how often.

namespace
{
struct inner
{
    ~inner() { std::cout << "Inner!\n"; }

    void finalize() { std::cout << "Inner 2!\n"; }
};

struct outer
{
    inner in;

    ~outer() { std::cout << "Outer!\n"; }

    void finalize()
    {
        std::cout << "Outer 2!\n";

        // normal destructor of the member
        af::destroy_in_place(in);

        // alternate finalizer of the member
        af::finalize_in_place(in);

        // normal destructor of *this, which destroys `in` once more
        af::destroy_in_place(*this);
    }
};
} // namespace

int main()
{
    {
        auto const guard = af::finalize_guard<outer>::create_from();
    }

    // Prints:
    // Outer 2!
    // Inner!
    // Inner 2!
    // Outer!
    // Inner!
    return 0;
}
