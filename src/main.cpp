#include "pcpMain.hpp"

int main(int argc, char** argv)
{
    return pcpMain(argc, argv);
}
