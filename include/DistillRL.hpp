//
// Created by moinshaikh on 3/5/26.
//

#pragma once
#include"Config.hpp"
#include"Errors.hpp"


#include"Distribution/Distribution.hpp"
#include"Distribution/Normal.hpp"


#include"Checkpoint/StateDict.hpp"
#include"Checkpoint/CheckpointReconciler.hpp"


#include"Model/Mlp.hpp"
#include"Model/GaussianActionHead.hpp"
#include"Model/StudentTeacher.hpp"

#include"ObservationNormalizer.hpp"
#include"ObservationRouter.hpp"
#include"RunningMeanStd.hpp"
