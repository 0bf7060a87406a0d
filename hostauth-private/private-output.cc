// Include files							/*{{{*/
#include <config.h>

#include <hostauth-private/private-output.h>

#include <iostream>
									/*}}}*/

std::ostream c1out(nullptr);

bool InitOutput(std::basic_streambuf<char> * const out)			/*{{{*/
{
   c1out.rdbuf(out);
   return true;
}
									/*}}}*/
