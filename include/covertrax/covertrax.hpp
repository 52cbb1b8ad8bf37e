#pragma once

#include "covertrax/aggregate.hpp"
#include "covertrax/aoi.hpp"
#include "covertrax/cache.hpp"
#include "covertrax/cancel.hpp"
#include "covertrax/classifier.hpp"
#include "covertrax/composite.hpp"
#include "covertrax/config.hpp"
#include "covertrax/error.hpp"
#include "covertrax/geodesy.hpp"
#include "covertrax/geojson.hpp"
#include "covertrax/imagery.hpp"
#include "covertrax/pipeline.hpp"
#include "covertrax/raster.hpp"
#include "covertrax/types.hpp"
#include "covertrax/vectorize.hpp"
