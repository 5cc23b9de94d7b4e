#include "core/Gate.h"

int main() {
    return runGate();
}
