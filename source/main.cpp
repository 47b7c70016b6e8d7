//
//  seedrl
//  Copyright (c) 2018 CSE-Lab, ETH Zurich, Switzerland. All rights reserved.
//  Distributed under the terms of the MIT license.
//

#include "Core/Engine.h"

int main (int argc, char** argv)
{
  seedrl::Engine e(argc, argv);
  if( e.parse() ) return 1;
  e.init();
  e.run();
  return 0;
}
