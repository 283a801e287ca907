#pragma once

int cmd_list(int argc, char** argv);
int cmd_show(int argc, char** argv);
int cmd_genres(int argc, char** argv);
