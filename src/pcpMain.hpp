#pragma once

int pcpMain(int argc, char** argv);
