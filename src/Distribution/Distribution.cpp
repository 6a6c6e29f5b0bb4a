//
// Created by moinshaikh on 1/30/26.
//

#include<vector>

#include"../../include/Distribution/Distribution.hpp"

namespace DistillRL
{
    std::vector<int64_t> Distribution::extendedShape(c10::ArrayRef<int64_t> sampleShape) const
    {
        std::vector<int64_t> shape(sampleShape.begin(), sampleShape.end());
        shape.insert(shape.end(), batch_shape.begin(), batch_shape.end());
        shape.insert(shape.end(), event_shape.begin(), event_shape.end());
        return shape;
    }
}
