/** LICENSE TEMPLATE */
#include "app.h"

int
main(int argc, const char **argv)
{
  return dapsync::Start(argc, argv);
}
