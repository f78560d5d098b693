#pragma once

int cmd_allocate(int argc, char** argv);
