#pragma once

int cmd_serve(int argc, char** argv, int first_arg);
