#pragma once

int cmd_score(int argc, char** argv);
