#include "a.h"
#include "/nonexistent/abs.h"

int main() {}
